// modules/trace/trace_exporter.cpp
#include "modules/trace/trace_exporter.h"
#include <algorithm>
#include <iterator>

namespace funcmodel {

void TraceExporter::on_node_start(const std::string& trace_id,
                                  const std::string& node_id,
                                  NodeType type,
                                  int attempt,
                                  bool dry_run,
                                  Timestamp at) {
    TraceRecord record;
    record.trace_id = trace_id;
    record.node_id = node_id;
    record.type = std::string(to_string(type));
    record.start_time = at;
    record.end_time = at;
    record.status = "running"; // updated in on_node_end
    record.attempt = attempt;
    record.mode = dry_run ? "dry_run" : "live";
    traces_.push_back(std::move(record));
}

void TraceExporter::on_node_end(const std::string& trace_id,
                                const std::string& node_id,
                                NodeType type,
                                const std::string& status,
                                const std::optional<std::string>& outcome,
                                bool dry_run,
                                Timestamp at) {
    auto it = std::find_if(traces_.rbegin(), traces_.rend(), [&](const TraceRecord& r) {
        return r.trace_id == trace_id && r.node_id == node_id && r.status == "running";
    });

    if (it != traces_.rend()) {
        it->end_time = at;
        it->status = status;
        it->outcome = outcome;
        return;
    }

    // skipped or cancelled before it ever ran
    TraceRecord record;
    record.trace_id = trace_id;
    record.node_id = node_id;
    record.type = std::string(to_string(type));
    record.start_time = at;
    record.end_time = at;
    record.status = status;
    record.outcome = outcome;
    record.mode = dry_run ? "dry_run" : "live";
    traces_.push_back(std::move(record));
}

std::vector<TraceRecord> TraceExporter::get_traces() const {
    return traces_;
}

std::vector<TraceRecord> TraceExporter::get_traces(const std::string& trace_id) const {
    std::vector<TraceRecord> out;
    std::copy_if(traces_.begin(), traces_.end(), std::back_inserter(out),
                 [&](const TraceRecord& r) { return r.trace_id == trace_id; });
    return out;
}

void TraceExporter::clear_traces() {
    traces_.clear();
}

} // namespace funcmodel
