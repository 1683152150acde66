#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <nlohmann/json.hpp>

namespace tradeguard {
namespace common {

/**
 * Strict unsigned field access for JSON documents.
 *
 * nlohmann's get<uint64_t>() casts negative and fractional numbers instead of
 * failing, so every unsigned field read from a config, snapshot or replay
 * file goes through these helpers. Non-integral, negative and non-numeric
 * values throw std::invalid_argument naming the field; a missing key throws
 * nlohmann::json::out_of_range as at() does.
 */

uint64_t as_u64(const nlohmann::json& value, const std::string& field);

/// object.at(key) checked with as_u64
uint64_t require_u64(const nlohmann::json& object, const std::string& key);

/// As require_u64, but an absent key yields fallback
uint64_t u64_or(const nlohmann::json& object, const std::string& key, uint64_t fallback);

/// JSON object of name -> unsigned integer
std::map<std::string, uint64_t> require_u64_map(const nlohmann::json& value,
                                                const std::string& field);

} // namespace common
} // namespace tradeguard
