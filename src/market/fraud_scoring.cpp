#include "market/fraud_scoring.h"
#include "common/logging.h"
#include <limits>

namespace tradeguard {
namespace market {

namespace {

uint64_t saturating_add(uint64_t a, uint64_t b) {
    if (a > std::numeric_limits<uint64_t>::max() - b) {
        return std::numeric_limits<uint64_t>::max();
    }
    return a + b;
}

} // anonymous namespace

uint64_t FraudScoringEngine::score(
    Amount price,
    ReputationPoints reputation,
    const std::string& category
) {
    uint64_t price_term = price / PRICE_RISK_DIVISOR;
    uint64_t reputation_term = reputation < REPUTATION_BASELINE
        ? REPUTATION_BASELINE - reputation
        : 0;
    uint64_t category_term = category == HIGH_RISK_CATEGORY
        ? HIGH_RISK_CATEGORY_SURCHARGE
        : 0;

    return saturating_add(saturating_add(price_term, reputation_term), category_term);
}

RiskAssessment FraudScoringEngine::assess(
    Amount price,
    ReputationPoints reputation,
    const std::string& category
) const {
    RiskAssessment assessment;
    const PolicyConfig& config = policy_.policy();

    if (!config.anomaly_detection_enabled) {
        return assessment;
    }

    uint64_t risk = score(price, reputation, category);
    assessment.score = risk;
    assessment.exceeds_threshold = risk > config.max_risk_score;

    LOG_TRACE("fraud", "price=", price, " reputation=", reputation,
              " category=", category, " score=", risk,
              " max=", config.max_risk_score);
    return assessment;
}

} // namespace market
} // namespace tradeguard
