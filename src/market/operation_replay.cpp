#include "market/operation_replay.h"
#include "common/hashing.h"
#include "common/json_fields.h"
#include "common/logging.h"
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace tradeguard {
namespace market {

namespace {

template <typename T>
Result<std::string> render(const Result<T>& result) {
    if (result.is_err()) {
        return Result<std::string>::propagate(result);
    }
    return Result<std::string>(std::to_string(result.value()));
}

Result<std::string> render(const Result<bool>& result) {
    if (result.is_err()) {
        return Result<std::string>::propagate(result);
    }
    return Result<std::string>(std::string(result.value() ? "true" : "false"));
}

Result<std::string> render(const Result<EscrowState>& result) {
    if (result.is_err()) {
        return Result<std::string>::propagate(result);
    }
    return Result<std::string>(std::string(to_string(result.value())));
}

Result<std::string> unknown_currency() {
    return Result<std::string>(ErrorKind::InvalidCurrency);
}

} // anonymous namespace

Result<std::string> apply_operation(TrustEngine& engine, const json& operation) {
    const std::string op = operation.at("op").get<std::string>();
    const Principal caller = operation.value("caller", std::string());

    if (op == "set_authority") {
        return render(engine.set_authority(operation.at("principal").get<std::string>()));
    }
    if (op == "set_fraud_threshold") {
        return render(engine.set_fraud_threshold(caller, common::require_u64(operation, "value")));
    }
    if (op == "set_min_reputation") {
        return render(engine.set_min_reputation(caller, common::require_u64(operation, "value")));
    }
    if (op == "set_max_risk_score") {
        return render(engine.set_max_risk_score(caller, common::require_u64(operation, "value")));
    }
    if (op == "toggle_anomaly_detection") {
        return render(engine.toggle_anomaly_detection(caller));
    }
    if (op == "blacklist_seller") {
        return render(engine.blacklist_seller(caller, operation.at("seller").get<std::string>()));
    }
    if (op == "unblacklist_seller") {
        return render(engine.unblacklist_seller(caller, operation.at("seller").get<std::string>()));
    }
    if (op == "add_arbitrator") {
        return render(engine.add_arbitrator(caller, operation.at("arbitrator").get<std::string>()));
    }
    if (op == "remove_arbitrator") {
        return render(engine.remove_arbitrator(caller, operation.at("arbitrator").get<std::string>()));
    }
    if (op == "seed_reputation") {
        ReputationPoints score = common::require_u64(operation, "score");
        engine.seed_reputation(operation.at("participant").get<std::string>(), score);
        return Result<std::string>(std::to_string(score));
    }
    if (op == "top_reputation") {
        std::ostringstream ranking;
        for (const auto& entry : engine.top_reputation(common::require_u64(operation, "count"))) {
            if (ranking.tellp() > 0) {
                ranking << " ";
            }
            ranking << entry.first << "=" << entry.second;
        }
        return Result<std::string>(ranking.str());
    }
    if (op == "advance_block_height") {
        return Result<std::string>(
            std::to_string(engine.advance_block_height(common::require_u64(operation, "blocks"))));
    }

    if (op == "submit_listing") {
        ListingDraft draft;
        draft.id = common::require_u64(operation, "id");
        draft.seller = operation.at("seller").get<std::string>();
        // A plain item description is hashed together with the seller
        if (operation.contains("item_hash")) {
            draft.item_hash = operation.at("item_hash").get<std::string>();
        } else {
            draft.item_hash = common::hashing::item_digest(draft.seller,
                                                           operation.at("item").get<std::string>());
        }
        if (operation.contains("seller_reputation")) {
            draft.seller_reputation = common::require_u64(operation, "seller_reputation");
        }
        draft.price = common::require_u64(operation, "price");
        draft.category = operation.at("category").get<std::string>();
        draft.location = operation.at("location").get<std::string>();
        draft.currency = operation.at("currency").get<std::string>();
        return render(engine.submit_listing(caller, draft));
    }
    if (op == "flag_listing") {
        return render(engine.flag_listing(caller, common::require_u64(operation, "id"),
                                          operation.value("reason", std::string()),
                                          common::require_u64(operation, "risk_score")));
    }
    if (op == "unflag_listing") {
        return render(engine.unflag_listing(caller, common::require_u64(operation, "id")));
    }
    if (op == "update_listing_price") {
        return render(engine.update_listing_price(caller, common::require_u64(operation, "id"),
                                                  common::require_u64(operation, "price")));
    }
    if (op == "pause_listing") {
        return render(engine.pause_listing(caller, common::require_u64(operation, "id")));
    }
    if (op == "resume_listing") {
        return render(engine.resume_listing(caller, common::require_u64(operation, "id")));
    }
    if (op == "close_listing") {
        return render(engine.close_listing(caller, common::require_u64(operation, "id")));
    }

    if (op == "open_escrow") {
        auto currency = parse_currency(operation.at("currency").get<std::string>());
        if (!currency.has_value()) {
            return unknown_currency();
        }
        return render(engine.open_escrow(caller, common::require_u64(operation, "listing_id"),
                                         common::require_u64(operation, "amount"), *currency));
    }
    if (op == "confirm_receipt") {
        return render(engine.confirm_receipt(caller, common::require_u64(operation, "listing_id")));
    }

    if (op == "open_dispute") {
        return render(engine.open_dispute(
            caller, common::require_u64(operation, "listing_id"),
            operation.value("evidence_refs", std::vector<std::string>{})));
    }
    if (op == "submit_evidence") {
        return render(engine.submit_evidence(caller, common::require_u64(operation, "dispute_id"),
                                             operation.at("evidence_ref").get<std::string>()));
    }
    if (op == "rule_dispute") {
        auto ruling = parse_ruling(operation.at("ruling").get<std::string>());
        if (!ruling.has_value()) {
            throw std::invalid_argument("unknown ruling");
        }
        return render(engine.rule_dispute(caller, common::require_u64(operation, "dispute_id"),
                                          *ruling));
    }

    throw std::invalid_argument("unknown operation " + op);
}

ReplaySummary replay_operations(TrustEngine& engine, const json& operations, std::ostream& out) {
    ReplaySummary summary;
    size_t index = 0;

    for (const auto& operation : operations) {
        std::string op = "?";
        if (operation.is_object() && operation.contains("op") && operation.at("op").is_string()) {
            op = operation.at("op").get<std::string>();
        }
        out << index++ << " " << op << " ";

        try {
            auto result = apply_operation(engine, operation);
            if (result.is_ok()) {
                out << "ok " << result.value() << std::endl;
                summary.applied++;
            } else {
                out << to_string(result.error_kind()) << std::endl;
                summary.rejected++;
            }
        } catch (const json::exception& e) {
            out << "malformed: " << e.what() << std::endl;
            LOG_WARN("replay", "Malformed operation ", index - 1, ": ", e.what());
            summary.malformed++;
        } catch (const std::invalid_argument& e) {
            out << "malformed: " << e.what() << std::endl;
            LOG_WARN("replay", "Malformed operation ", index - 1, ": ", e.what());
            summary.malformed++;
        }
    }

    return summary;
}

} // namespace market
} // namespace tradeguard
