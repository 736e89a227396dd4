// core/services.h
#ifndef FUNCMODEL_CORE_SERVICES_H
#define FUNCMODEL_CORE_SERVICES_H

#include "core/types/node.h" // Timestamp
#include <memory>
#include <string>

namespace funcmodel {

class Clock {
public:
    virtual ~Clock() = default;
    virtual Timestamp now() const = 0;
};

class SystemClock : public Clock {
public:
    Timestamp now() const override { return std::chrono::system_clock::now(); }
};

class IdGenerator {
public:
    virtual ~IdGenerator() = default;
    // RFC4122 version 4, lowercase
    virtual std::string next_uuid() = 0;
};

class RandomIdGenerator : public IdGenerator {
public:
    std::string next_uuid() override;
};

// Collaborators handed to the aggregate, the engine and the context service
struct DomainServices {
    std::shared_ptr<Clock> clock;
    std::shared_ptr<IdGenerator> ids;

    static DomainServices system_default();

    NodeId new_node_id() const;
    ModelId new_model_id() const;
};

} // namespace funcmodel

#endif // FUNCMODEL_CORE_SERVICES_H
