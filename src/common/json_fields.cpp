#include "common/json_fields.h"
#include <stdexcept>

namespace tradeguard {
namespace common {

uint64_t as_u64(const nlohmann::json& value, const std::string& field) {
    // Literals built in code are signed integers; parsed non-negative ones are unsigned
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    if (value.is_number_integer() && value.get<int64_t>() >= 0) {
        return static_cast<uint64_t>(value.get<int64_t>());
    }
    throw std::invalid_argument("field '" + field + "' must be a non-negative integer, got " +
                                value.dump());
}

uint64_t require_u64(const nlohmann::json& object, const std::string& key) {
    return as_u64(object.at(key), key);
}

uint64_t u64_or(const nlohmann::json& object, const std::string& key, uint64_t fallback) {
    if (!object.contains(key)) {
        return fallback;
    }
    return as_u64(object.at(key), key);
}

std::map<std::string, uint64_t> require_u64_map(const nlohmann::json& value,
                                                const std::string& field) {
    if (!value.is_object()) {
        throw std::invalid_argument("field '" + field + "' must be an object");
    }
    std::map<std::string, uint64_t> out;
    for (const auto& entry : value.items()) {
        out[entry.key()] = as_u64(entry.value(), field + "." + entry.key());
    }
    return out;
}

} // namespace common
} // namespace tradeguard
