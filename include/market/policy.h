#pragma once

#include "market/types.h"

#include <optional>
#include <set>
#include <string>

namespace tradeguard {
namespace market {

/**
 * Mutable numeric policy. Defaults match the marketplace contract.
 * No bounds are enforced beyond the type range.
 */
struct PolicyConfig {
    uint64_t fraud_threshold = 50;
    uint64_t min_reputation = 100;
    uint64_t max_risk_score = 80;
    bool anomaly_detection_enabled = true;
};

/**
 * One-time-settable administrator identity.
 * Lifecycle: uninitialized -> set. Never changes after the first set.
 */
class AccessControl {
public:
    AccessControl() = default;

    Result<bool> set_authority(const Principal& principal);

    /**
     * Capability check shared by every privileged operation.
     * Fails Unauthorized if the authority is unset or caller differs.
     */
    Result<bool> require_authority(const Principal& caller) const;

    bool is_authority(const Principal& caller) const;
    const std::optional<Principal>& authority() const { return authority_; }

    // Snapshot restore only
    void restore(std::optional<Principal> authority) { authority_ = std::move(authority); }

private:
    std::optional<Principal> authority_;
};

/**
 * Configuration/Authority component: the policy values and seller blacklist,
 * both mutable only through AccessControl.
 */
class PolicyStore {
public:
    explicit PolicyStore(AccessControl& access, PolicyConfig initial = {});

    Result<uint64_t> set_fraud_threshold(const Principal& caller, uint64_t value);
    Result<uint64_t> set_min_reputation(const Principal& caller, uint64_t value);
    Result<uint64_t> set_max_risk_score(const Principal& caller, uint64_t value);

    /// @return The new value of the anomaly-detection flag
    Result<bool> toggle_anomaly_detection(const Principal& caller);

    /// @return true if the seller was newly added
    Result<bool> blacklist_seller(const Principal& caller, const Principal& seller);

    /// @return true if the seller was present and removed
    Result<bool> unblacklist_seller(const Principal& caller, const Principal& seller);

    bool is_blacklisted(const Principal& seller) const;

    const PolicyConfig& policy() const { return policy_; }
    const std::set<Principal>& blacklist() const { return blacklist_; }
    AccessControl& access() { return access_; }
    const AccessControl& access() const { return access_; }

    // Snapshot restore only
    void restore(const PolicyConfig& policy, std::set<Principal> blacklist);

private:
    AccessControl& access_;
    PolicyConfig policy_;
    std::set<Principal> blacklist_;
};

} // namespace market
} // namespace tradeguard
