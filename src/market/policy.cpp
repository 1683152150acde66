#include "market/policy.h"
#include "common/logging.h"

namespace tradeguard {
namespace market {

// ============================================================================
// AccessControl Implementation
// ============================================================================

Result<bool> AccessControl::set_authority(const Principal& principal) {
    if (authority_.has_value()) {
        LOG_REJECTED("policy", "set_authority", ErrorKind::AlreadySet);
        return Result<bool>(ErrorKind::AlreadySet);
    }
    if (principal.empty()) {
        return Result<bool>(ErrorKind::InvalidPrincipal);
    }

    authority_ = principal;
    LOG_INFO("policy", "Authority set to ", principal);
    return Result<bool>(true);
}

Result<bool> AccessControl::require_authority(const Principal& caller) const {
    if (!is_authority(caller)) {
        LOG_REJECTED("policy", "privileged operation", ErrorKind::Unauthorized);
        return Result<bool>(ErrorKind::Unauthorized);
    }
    return Result<bool>(true);
}

bool AccessControl::is_authority(const Principal& caller) const {
    return authority_.has_value() && *authority_ == caller;
}

// ============================================================================
// PolicyStore Implementation
// ============================================================================

PolicyStore::PolicyStore(AccessControl& access, PolicyConfig initial)
    : access_(access), policy_(initial) {}

Result<uint64_t> PolicyStore::set_fraud_threshold(const Principal& caller, uint64_t value) {
    auto allowed = access_.require_authority(caller);
    if (allowed.is_err()) {
        return Result<uint64_t>::propagate(allowed);
    }

    policy_.fraud_threshold = value;
    LOG_INFO("policy", "fraud_threshold=", value);
    return Result<uint64_t>(value);
}

Result<uint64_t> PolicyStore::set_min_reputation(const Principal& caller, uint64_t value) {
    auto allowed = access_.require_authority(caller);
    if (allowed.is_err()) {
        return Result<uint64_t>::propagate(allowed);
    }

    policy_.min_reputation = value;
    LOG_INFO("policy", "min_reputation=", value);
    return Result<uint64_t>(value);
}

Result<uint64_t> PolicyStore::set_max_risk_score(const Principal& caller, uint64_t value) {
    auto allowed = access_.require_authority(caller);
    if (allowed.is_err()) {
        return Result<uint64_t>::propagate(allowed);
    }

    policy_.max_risk_score = value;
    LOG_INFO("policy", "max_risk_score=", value);
    return Result<uint64_t>(value);
}

Result<bool> PolicyStore::toggle_anomaly_detection(const Principal& caller) {
    auto allowed = access_.require_authority(caller);
    if (allowed.is_err()) {
        return allowed;
    }

    policy_.anomaly_detection_enabled = !policy_.anomaly_detection_enabled;
    LOG_INFO("policy", "anomaly_detection_enabled=",
             policy_.anomaly_detection_enabled ? "true" : "false");
    return Result<bool>(policy_.anomaly_detection_enabled);
}

Result<bool> PolicyStore::blacklist_seller(const Principal& caller, const Principal& seller) {
    auto allowed = access_.require_authority(caller);
    if (allowed.is_err()) {
        return allowed;
    }
    if (seller.empty()) {
        return Result<bool>(ErrorKind::InvalidPrincipal);
    }

    bool inserted = blacklist_.insert(seller).second;
    LOG_INFO("policy", "Blacklisted seller ", seller);
    return Result<bool>(inserted);
}

Result<bool> PolicyStore::unblacklist_seller(const Principal& caller, const Principal& seller) {
    auto allowed = access_.require_authority(caller);
    if (allowed.is_err()) {
        return allowed;
    }

    bool removed = blacklist_.erase(seller) > 0;
    LOG_INFO("policy", "Removed seller ", seller, " from blacklist");
    return Result<bool>(removed);
}

bool PolicyStore::is_blacklisted(const Principal& seller) const {
    return blacklist_.count(seller) > 0;
}

void PolicyStore::restore(const PolicyConfig& policy, std::set<Principal> blacklist) {
    policy_ = policy;
    blacklist_ = std::move(blacklist);
}

} // namespace market
} // namespace tradeguard
