#pragma once

#include "market/policy.h"

#include <optional>
#include <string>

namespace tradeguard {
namespace market {

/// Surcharge added to the risk score of listings in HIGH_RISK_CATEGORY
constexpr uint64_t HIGH_RISK_CATEGORY_SURCHARGE = 20;

/// Reputation at or above which the reputation term contributes nothing
constexpr uint64_t REPUTATION_BASELINE = 100;

/// Price units per risk point
constexpr uint64_t PRICE_RISK_DIVISOR = 100;

/**
 * Outcome of scoring a listing against the current policy
 */
struct RiskAssessment {
    std::optional<uint64_t> score;  // absent when anomaly detection is off
    bool exceeds_threshold = false;
};

/**
 * Risk scoring for listing admission.
 *
 * score = floor(price / 100) + max(0, 100 - reputation) + 20 if high-risk.
 * All terms and the sum saturate instead of wrapping.
 */
class FraudScoringEngine {
public:
    explicit FraudScoringEngine(const PolicyStore& policy) : policy_(policy) {}

    static uint64_t score(Amount price, ReputationPoints reputation,
                          const std::string& category);

    RiskAssessment assess(Amount price, ReputationPoints reputation,
                          const std::string& category) const;

private:
    const PolicyStore& policy_;
};

} // namespace market
} // namespace tradeguard
