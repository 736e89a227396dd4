// modules/trace/trace_exporter.h
#ifndef FUNCMODEL_MODULES_TRACE_TRACE_EXPORTER_H
#define FUNCMODEL_MODULES_TRACE_TRACE_EXPORTER_H

#include "core/types/context.h"
#include "core/types/node.h"
#include <optional>
#include <string>
#include <vector>

namespace funcmodel {

// One attempt of one plan entry
struct TraceRecord {
    std::string trace_id;                   // plan id
    std::string node_id;
    std::string type;                       // node type literal
    Timestamp start_time;
    Timestamp end_time;
    std::string status;                     // "running", then the status the attempt ended in
    std::optional<std::string> outcome;     // observed outcome that ended the attempt
    int attempt = 0;
    std::string mode;                       // "live" or "dry_run"
    Value metadata = Value::object();
};

class TraceExporter {
public:
    void on_node_start(const std::string& trace_id,
                       const std::string& node_id,
                       NodeType type,
                       int attempt,
                       bool dry_run,
                       Timestamp at);

    // Closes the open record for the node, or writes a zero-length one if the node never started
    void on_node_end(const std::string& trace_id,
                     const std::string& node_id,
                     NodeType type,
                     const std::string& status,
                     const std::optional<std::string>& outcome,
                     bool dry_run,
                     Timestamp at);

    std::vector<TraceRecord> get_traces() const;
    std::vector<TraceRecord> get_traces(const std::string& trace_id) const;
    void clear_traces();

private:
    std::vector<TraceRecord> traces_;
};

} // namespace funcmodel

#endif // FUNCMODEL_MODULES_TRACE_TRACE_EXPORTER_H
