#include "market/engine_config.h"
#include "common/json_fields.h"
#include "common/logging.h"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace tradeguard {
namespace market {

EngineConfig EngineConfigManager::create_default() {
    EngineConfig config;

    config.policy.fraud_threshold = 50;
    config.policy.min_reputation = 100;
    config.policy.max_risk_score = 80;
    config.policy.anomaly_detection_enabled = true;

    config.log_level = "INFO";
    config.log_json = false;

    return config;
}

std::string EngineConfigManager::validate_config(const EngineConfig& config) {
    if (config.authority.has_value() && config.authority->empty()) {
        return "Authority cannot be empty";
    }

    for (const auto& arbitrator : config.arbitrators) {
        if (arbitrator.empty()) {
            return "Arbitrator principal cannot be empty";
        }
    }

    for (const auto& identity : config.registered_identities) {
        if (identity.empty()) {
            return "Registered identity cannot be empty";
        }
    }

    for (const auto& entry : config.initial_reputation) {
        if (entry.first.empty()) {
            return "Reputation entry has an empty principal";
        }
    }

    if (!common::parse_log_level(config.log_level).has_value()) {
        return "Invalid log level: " + config.log_level;
    }

    return ""; // Valid
}

Result<EngineConfig> EngineConfigManager::load_from_json(const json& j) {
    try {
        if (!j.is_object()) {
            return Result<EngineConfig>(ErrorKind::ConfigInvalid, "configuration must be an object");
        }

        EngineConfig config = create_default();

        if (j.contains("policy")) {
            const json& policy = j.at("policy");
            if (!policy.is_object()) {
                return Result<EngineConfig>(ErrorKind::ConfigInvalid, "policy must be an object");
            }
            config.policy.fraud_threshold =
                common::u64_or(policy, "fraud_threshold", config.policy.fraud_threshold);
            config.policy.min_reputation =
                common::u64_or(policy, "min_reputation", config.policy.min_reputation);
            config.policy.max_risk_score =
                common::u64_or(policy, "max_risk_score", config.policy.max_risk_score);
            config.policy.anomaly_detection_enabled =
                policy.value("anomaly_detection_enabled", config.policy.anomaly_detection_enabled);
        }

        if (j.contains("authority") && !j.at("authority").is_null()) {
            config.authority = j.at("authority").get<std::string>();
        }

        config.arbitrators = j.value("arbitrators", std::set<Principal>{});
        config.registered_identities = j.value("registered_identities", std::set<Principal>{});
        if (j.contains("initial_reputation")) {
            config.initial_reputation =
                common::require_u64_map(j.at("initial_reputation"), "initial_reputation");
        }

        config.log_level = j.value("log_level", config.log_level);
        config.log_json = j.value("log_json", config.log_json);

        std::string error = validate_config(config);
        if (!error.empty()) {
            return Result<EngineConfig>(ErrorKind::ConfigInvalid, error);
        }

        return Result<EngineConfig>(std::move(config));
    } catch (const json::exception& e) {
        return Result<EngineConfig>(ErrorKind::ConfigInvalid,
                                    "JSON parsing error: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        return Result<EngineConfig>(ErrorKind::ConfigInvalid, e.what());
    }
}

json EngineConfigManager::to_json(const EngineConfig& config) {
    json j;

    j["policy"] = {
        {"fraud_threshold", config.policy.fraud_threshold},
        {"min_reputation", config.policy.min_reputation},
        {"max_risk_score", config.policy.max_risk_score},
        {"anomaly_detection_enabled", config.policy.anomaly_detection_enabled}
    };

    if (config.authority.has_value()) {
        j["authority"] = *config.authority;
    } else {
        j["authority"] = nullptr;
    }

    j["arbitrators"] = config.arbitrators;
    j["registered_identities"] = config.registered_identities;
    j["initial_reputation"] = config.initial_reputation;
    j["log_level"] = config.log_level;
    j["log_json"] = config.log_json;

    return j;
}

Result<EngineConfig> EngineConfigManager::load_from_file(const std::string& config_path) {
    std::ifstream file(config_path);
    if (!file.is_open()) {
        LOG_ERROR("config", "Cannot open configuration file ", config_path);
        return Result<EngineConfig>(ErrorKind::IoError, config_path);
    }

    json j = json::parse(file, nullptr, false);
    if (j.is_discarded()) {
        LOG_ERROR("config", "Configuration file ", config_path, " is not valid JSON");
        return Result<EngineConfig>(ErrorKind::ConfigInvalid, "not valid JSON: " + config_path);
    }

    auto config = load_from_json(j);
    if (config.is_err()) {
        LOG_ERROR("config", config.error());
    }
    return config;
}

Result<bool> EngineConfigManager::save_to_file(const EngineConfig& config,
                                               const std::string& config_path) {
    std::ofstream file(config_path);
    if (!file.is_open()) {
        return Result<bool>(ErrorKind::IoError, config_path);
    }

    file << to_json(config).dump(2) << std::endl;
    if (!file.good()) {
        return Result<bool>(ErrorKind::IoError, config_path);
    }
    return Result<bool>(true);
}

} // namespace market
} // namespace tradeguard
