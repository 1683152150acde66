#pragma once

#include "market/policy.h"

#include <map>
#include <optional>
#include <set>
#include <string>
#include <nlohmann/json.hpp>

namespace tradeguard {
namespace market {

/**
 * @brief Startup configuration of a TrustEngine
 */
struct EngineConfig {
    PolicyConfig policy;

    // Set once at startup when present
    std::optional<Principal> authority;

    std::set<Principal> arbitrators;

    // Empty means no identity gate is attached
    std::set<Principal> registered_identities;

    // Reputation seeded before any operation runs
    std::map<Principal, ReputationPoints> initial_reputation;

    std::string log_level = "INFO";
    bool log_json = false;
};

/**
 * @brief Engine configuration loader
 */
class EngineConfigManager {
public:
    /**
     * @brief Load configuration from a JSON file
     * @param config_path path to configuration file
     * @return loaded configuration, IoError if unreadable, ConfigInvalid if
     *         malformed or failing validate_config()
     */
    static Result<EngineConfig> load_from_file(const std::string& config_path);

    /**
     * @brief Save configuration to a JSON file
     */
    static Result<bool> save_to_file(const EngineConfig& config, const std::string& config_path);

    /**
     * @brief Load configuration from a JSON object
     *
     * Missing keys keep their defaults.
     */
    static Result<EngineConfig> load_from_json(const nlohmann::json& json);

    static nlohmann::json to_json(const EngineConfig& config);

    static EngineConfig create_default();

    /**
     * @brief Validate configuration
     * @return validation error message, or empty string if valid
     */
    static std::string validate_config(const EngineConfig& config);
};

} // namespace market
} // namespace tradeguard
