#pragma once

#include "market/types.h"

#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace tradeguard {
namespace market {

/// Reputation change applied to seller and buyer on a fulfilled trade
constexpr ReputationPoints FULFILLED_REPUTATION_BOOST = 10;

/// Reputation removed from a seller when a dispute is refunded
constexpr ReputationPoints FRAUD_REPUTATION_PENALTY = 50;

/**
 * Participant -> score mapping.
 *
 * Scores are seeded by the host (identity onboarding lives outside the core)
 * and afterwards change only through apply_outcome().
 */
class ReputationLedger {
public:
    ReputationLedger() = default;

    /**
     * Set the initial score of a participant
     */
    void seed(const Principal& participant, ReputationPoints score);

    /**
     * Apply a settlement outcome.
     * Unknown participants start from zero; penalties saturate at zero and
     * boosts saturate at UINT64_MAX.
     * @return The new score
     */
    ReputationPoints apply_outcome(const Principal& participant, ReputationOutcome outcome);

    std::optional<ReputationPoints> get(const Principal& participant) const;

    /**
     * Highest scores first, ties broken by participant id
     */
    std::vector<std::pair<Principal, ReputationPoints>> top(size_t count) const;

    const std::map<Principal, ReputationPoints>& scores() const { return scores_; }

    // Snapshot restore only
    void restore(std::map<Principal, ReputationPoints> scores) { scores_ = std::move(scores); }

private:
    std::map<Principal, ReputationPoints> scores_;
};

} // namespace market
} // namespace tradeguard
