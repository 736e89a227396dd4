// core/types/value_objects.h
#ifndef FUNCMODEL_CORE_TYPES_VALUE_OBJECTS_H
#define FUNCMODEL_CORE_TYPES_VALUE_OBJECTS_H

#include "enums.h"
#include "result.h"
#include <functional>
#include <string>
#include <vector>

namespace funcmodel {

bool is_uuid_v4(const std::string& s);
std::string to_lower(std::string s);

// UUID v4 identifier; stored lowercase so equality is case-insensitive.
// Tag keeps node ids and model ids from being mixed up.
template <typename Tag>
class UuidValue {
public:
    static Result<UuidValue> create(const std::string& raw) {
        if (!is_uuid_v4(raw)) {
            return validation_error("Invalid " + std::string(Tag::kName) + " format: '" + raw + "'");
        }
        return Result<UuidValue>::ok(UuidValue(to_lower(raw)));
    }

    const std::string& value() const { return value_; }
    const std::string& str() const { return value_; }

    bool operator==(const UuidValue& other) const { return value_ == other.value_; }
    bool operator<(const UuidValue& other) const { return value_ < other.value_; }

private:
    explicit UuidValue(std::string v) : value_(std::move(v)) {}
    std::string value_;
};

struct NodeIdTag { static constexpr const char* kName = "node id"; };
struct ModelIdTag { static constexpr const char* kName = "model id"; };

using NodeId = UuidValue<NodeIdTag>;
using ModelId = UuidValue<ModelIdTag>;

class ModelName {
public:
    static constexpr size_t kMaxLength = 255;

    static Result<ModelName> create(const std::string& raw);

    const std::string& value() const { return value_; }
    bool operator==(const ModelName& other) const { return value_ == other.value_; }

private:
    explicit ModelName(std::string v) : value_(std::move(v)) {}
    std::string value_;
};

// MAJOR.MINOR.PATCH
class Version {
public:
    static Result<Version> create(const std::string& raw);
    static Version initial() { return Version(1, 0, 0); }

    int major_number() const { return major_; }
    int minor_number() const { return minor_; }
    int patch_number() const { return patch_; }
    std::string to_string() const;

    int compare(const Version& other) const;
    bool is_greater_than(const Version& other) const { return compare(other) > 0; }
    bool is_less_than(const Version& other) const { return compare(other) < 0; }
    bool operator==(const Version& other) const { return compare(other) == 0; }

    Version increment_major() const { return Version(major_ + 1, 0, 0); }
    Version increment_minor() const { return Version(major_, minor_ + 1, 0); }
    Version increment_patch() const { return Version(major_, minor_, patch_ + 1); }

private:
    Version(int maj, int min, int pat) : major_(maj), minor_(min), patch_(pat) {}
    int major_;
    int minor_;
    int patch_;
};

class Position {
public:
    static Result<Position> create(double x, double y);
    static Position origin() { return Position(0.0, 0.0); }

    double x() const { return x_; }
    double y() const { return y_; }

    double distance_to(const Position& other) const;
    Result<Position> move_by(double dx, double dy) const { return create(x_ + dx, y_ + dy); }

    bool operator==(const Position& other) const { return x_ == other.x_ && y_ == other.y_; }

private:
    Position(double x, double y) : x_(x), y_(y) {}
    double x_;
    double y_;
};

// Edge weight in [0, 1]
class LinkStrength {
public:
    static Result<LinkStrength> create(double value);
    static LinkStrength full() { return LinkStrength(1.0); }

    double value() const { return value_; }

private:
    explicit LinkStrength(double v) : value_(v) {}
    double value_;
};

struct RetryPolicy {
    static constexpr int kMaxRetries = 10;

    int max_retries = 0;
    BackoffStrategy backoff = BackoffStrategy::EXPONENTIAL;
    int initial_delay_ms = 1000;
    int max_delay_ms = 30000;
    Escalation escalation = Escalation::FAILED;

    VoidResult validate() const;

    // Delay before the given retry attempt (1-based), capped at max_delay_ms
    int calculate_delay(int attempt) const;
};

struct RaciAssignment {
    std::vector<std::string> responsible;
    std::vector<std::string> accountable;
    std::vector<std::string> consulted;
    std::vector<std::string> informed;

    VoidResult validate() const;
    bool has_role(const std::string& person, RaciRole role) const;
    std::vector<RaciRole> roles_of(const std::string& person) const;
    const std::vector<std::string>& people(RaciRole role) const;
};

} // namespace funcmodel

namespace std {
template <typename Tag>
struct hash<funcmodel::UuidValue<Tag>> {
    size_t operator()(const funcmodel::UuidValue<Tag>& id) const {
        return hash<string>{}(id.value());
    }
};
} // namespace std

#endif // FUNCMODEL_CORE_TYPES_VALUE_OBJECTS_H
