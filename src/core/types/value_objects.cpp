// core/types/value_objects.cpp
#include "core/types/value_objects.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>

namespace funcmodel {

namespace {

const std::regex& uuid_v4_pattern() {
    static const std::regex pattern(
        "^[0-9a-fA-F]{8}-[0-9a-fA-F]{4}-4[0-9a-fA-F]{3}-[89abAB][0-9a-fA-F]{3}-[0-9a-fA-F]{12}$");
    return pattern;
}

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

VoidResult check_people(const std::vector<std::string>& people, size_t limit, const char* role) {
    if (people.size() > limit) {
        return validation_error("Too many " + std::string(role) + " assignments (max " + std::to_string(limit) + ")");
    }
    for (const auto& p : people) {
        if (trim(p).empty()) {
            return validation_error("Empty name in " + std::string(role) + " assignments");
        }
    }
    return VoidResult::ok();
}

} // namespace

bool is_uuid_v4(const std::string& s) {
    return std::regex_match(s, uuid_v4_pattern());
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

Result<ModelName> ModelName::create(const std::string& raw) {
    std::string name = trim(raw);
    if (name.empty()) {
        return validation_error("Model name cannot be empty");
    }
    if (name.size() > kMaxLength) {
        return validation_error("Model name cannot exceed " + std::to_string(kMaxLength) + " characters");
    }
    return Result<ModelName>::ok(ModelName(std::move(name)));
}

Result<Version> Version::create(const std::string& raw) {
    static const std::regex pattern("^(0|[1-9][0-9]*)\\.(0|[1-9][0-9]*)\\.(0|[1-9][0-9]*)$");
    std::smatch m;
    if (!std::regex_match(raw, m, pattern)) {
        return validation_error("Invalid version format: '" + raw + "' (expected MAJOR.MINOR.PATCH)");
    }
    try {
        return Result<Version>::ok(Version(std::stoi(m[1]), std::stoi(m[2]), std::stoi(m[3])));
    } catch (const std::out_of_range&) {
        return validation_error("Version component out of range: '" + raw + "'");
    }
}

std::string Version::to_string() const {
    return std::to_string(major_) + "." + std::to_string(minor_) + "." + std::to_string(patch_);
}

int Version::compare(const Version& other) const {
    if (major_ != other.major_) return major_ < other.major_ ? -1 : 1;
    if (minor_ != other.minor_) return minor_ < other.minor_ ? -1 : 1;
    if (patch_ != other.patch_) return patch_ < other.patch_ ? -1 : 1;
    return 0;
}

Result<Position> Position::create(double x, double y) {
    if (!std::isfinite(x) || !std::isfinite(y)) {
        return validation_error("Position coordinates must be finite numbers");
    }
    if (x < 0 || y < 0) {
        return validation_error("Position coordinates cannot be negative");
    }
    return Result<Position>::ok(Position(x, y));
}

double Position::distance_to(const Position& other) const {
    return std::hypot(x_ - other.x_, y_ - other.y_);
}

Result<LinkStrength> LinkStrength::create(double value) {
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        return validation_error("Link strength must be between 0 and 1");
    }
    return Result<LinkStrength>::ok(LinkStrength(value));
}

VoidResult RetryPolicy::validate() const {
    if (max_retries < 0 || max_retries > kMaxRetries) {
        return validation_error("Max retries must be between 0 and " + std::to_string(kMaxRetries));
    }
    if (initial_delay_ms <= 0) {
        return validation_error("Initial retry delay must be positive");
    }
    if (max_delay_ms < initial_delay_ms) {
        return validation_error("Max retry delay cannot be less than the initial delay");
    }
    return VoidResult::ok();
}

int RetryPolicy::calculate_delay(int attempt) const {
    if (attempt < 1) attempt = 1;
    double delay = initial_delay_ms;
    switch (backoff) {
        case BackoffStrategy::LINEAR:
            delay = static_cast<double>(initial_delay_ms) * attempt;
            break;
        case BackoffStrategy::EXPONENTIAL:
            delay = initial_delay_ms * std::pow(2.0, attempt - 1);
            break;
        case BackoffStrategy::CONSTANT:
            break;
    }
    return static_cast<int>(std::min<double>(delay, max_delay_ms));
}

VoidResult RaciAssignment::validate() const {
    return check_people(responsible, 10, "responsible")
        .flat_map([&] { return check_people(accountable, 10, "accountable"); })
        .flat_map([&] { return check_people(consulted, 20, "consulted"); })
        .flat_map([&] { return check_people(informed, 20, "informed"); });
}

const std::vector<std::string>& RaciAssignment::people(RaciRole role) const {
    switch (role) {
        case RaciRole::RESPONSIBLE: return responsible;
        case RaciRole::ACCOUNTABLE: return accountable;
        case RaciRole::CONSULTED: return consulted;
        case RaciRole::INFORMED: return informed;
    }
    return responsible;
}

bool RaciAssignment::has_role(const std::string& person, RaciRole role) const {
    const auto& list = people(role);
    return std::find(list.begin(), list.end(), person) != list.end();
}

std::vector<RaciRole> RaciAssignment::roles_of(const std::string& person) const {
    std::vector<RaciRole> roles;
    for (auto role : {RaciRole::RESPONSIBLE, RaciRole::ACCOUNTABLE, RaciRole::CONSULTED, RaciRole::INFORMED}) {
        if (has_role(person, role)) roles.push_back(role);
    }
    return roles;
}

} // namespace funcmodel
