#include "market/reputation_ledger.h"
#include "common/logging.h"
#include <algorithm>
#include <limits>

namespace tradeguard {
namespace market {

void ReputationLedger::seed(const Principal& participant, ReputationPoints score) {
    scores_[participant] = score;
}

ReputationPoints ReputationLedger::apply_outcome(
    const Principal& participant,
    ReputationOutcome outcome
) {
    ReputationPoints& score = scores_[participant];
    ReputationPoints before = score;

    switch (outcome) {
        case ReputationOutcome::Fulfilled:
            if (score > std::numeric_limits<ReputationPoints>::max() - FULFILLED_REPUTATION_BOOST) {
                score = std::numeric_limits<ReputationPoints>::max();
            } else {
                score += FULFILLED_REPUTATION_BOOST;
            }
            break;

        case ReputationOutcome::FraudSuspected:
            score = score > FRAUD_REPUTATION_PENALTY ? score - FRAUD_REPUTATION_PENALTY : 0;
            break;
    }

    LOG_DEBUG("reputation", participant, " ", to_string(outcome), ": ", before, " -> ", score);
    return score;
}

std::optional<ReputationPoints> ReputationLedger::get(const Principal& participant) const {
    auto it = scores_.find(participant);
    if (it == scores_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::pair<Principal, ReputationPoints>> ReputationLedger::top(size_t count) const {
    std::vector<std::pair<Principal, ReputationPoints>> all_scores(scores_.begin(), scores_.end());

    std::stable_sort(all_scores.begin(), all_scores.end(),
        [](const auto& a, const auto& b) { return a.second > b.second; });

    if (all_scores.size() > count) {
        all_scores.resize(count);
    }
    return all_scores;
}

} // namespace market
} // namespace tradeguard
