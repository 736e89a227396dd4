// core/services.cpp
#include "core/services.h"
#include <array>
#include <cstdint>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

namespace funcmodel {

std::string RandomIdGenerator::next_uuid() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};

    std::array<uint8_t, 16> bytes{};
    for (auto& b : bytes) {
        b = static_cast<uint8_t>(rng());
    }
    // RFC4122 variant + version 4
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    std::ostringstream oss;
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) oss << "-";
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    }
    return oss.str();
}

DomainServices DomainServices::system_default() {
    return DomainServices{std::make_shared<SystemClock>(), std::make_shared<RandomIdGenerator>()};
}

NodeId DomainServices::new_node_id() const {
    auto id = NodeId::create(ids->next_uuid());
    if (id.is_failure()) {
        throw std::logic_error("IdGenerator produced an invalid uuid: " + id.message());
    }
    return id.value();
}

ModelId DomainServices::new_model_id() const {
    auto id = ModelId::create(ids->next_uuid());
    if (id.is_failure()) {
        throw std::logic_error("IdGenerator produced an invalid uuid: " + id.message());
    }
    return id.value();
}

} // namespace funcmodel
