#include "market/trust_engine.h"
#include "common/hashing.h"
#include "common/json_fields.h"
#include "common/logging.h"
#include <fstream>
#include <stdexcept>

using json = nlohmann::json;

namespace tradeguard {
namespace market {

namespace {

// ============================================================================
// Snapshot Encoding
// ============================================================================

json listing_to_json(const Listing& listing) {
    return json{
        {"id", listing.id},
        {"item_hash", listing.item_hash},
        {"seller", listing.seller},
        {"price", listing.price},
        {"category", listing.category},
        {"location", listing.location},
        {"currency", to_string(listing.currency)},
        {"status", to_string(listing.status())},
        {"created_at", listing.created_at},
        {"paused_by_seller", listing.paused_by_seller},
        {"closed", listing.closed}
    };
}

json flag_to_json(const FlaggedListing& flag) {
    return json{
        {"listing_id", flag.listing_id},
        {"reason", flag.reason},
        {"timestamp", flag.timestamp},
        {"risk_score", flag.risk_score}
    };
}

json escrow_to_json(const EscrowRecord& escrow) {
    return json{
        {"escrow_id", escrow.escrow_id},
        {"listing_id", escrow.listing_id},
        {"buyer", escrow.buyer},
        {"seller", escrow.seller},
        {"amount", escrow.amount},
        {"currency", to_string(escrow.currency)},
        {"state", to_string(escrow.state)},
        {"opened_at", escrow.opened_at},
        {"settled_at", escrow.settled_at}
    };
}

json dispute_to_json(const Dispute& dispute) {
    json j{
        {"dispute_id", dispute.dispute_id},
        {"listing_id", dispute.listing_id},
        {"escrow_id", dispute.escrow_id},
        {"opened_by", dispute.opened_by},
        {"evidence_refs", dispute.evidence_refs},
        {"state", to_string(dispute.state)},
        {"arbitrator", dispute.arbitrator},
        {"opened_at", dispute.opened_at},
        {"ruled_at", dispute.ruled_at}
    };
    if (dispute.ruling.has_value()) {
        j["ruling"] = to_string(*dispute.ruling);
    } else {
        j["ruling"] = nullptr;
    }
    return j;
}

// ============================================================================
// Snapshot Decoding
// ============================================================================

/**
 * Fully decoded snapshot, committed to the engine only after every
 * section has been read and cross-checked.
 */
struct DecodedSnapshot {
    std::optional<Principal> authority;
    PolicyConfig policy;
    std::set<Principal> blacklist;
    std::optional<std::set<Principal>> arbitrators;
    std::map<std::string, ListingId> history;
    std::map<ListingId, Listing> listings;
    std::map<EscrowId, EscrowRecord> escrows;
    std::set<ListingId> escrow_locks;
    std::map<BalanceKey, Amount> balances;
    std::map<DisputeId, Dispute> disputes;
    std::set<EscrowId> disputed;
    std::map<Principal, ReputationPoints> reputation;
    BlockHeight block_height = 0;
    EscrowId next_escrow_id = 1;
    DisputeId next_dispute_id = 1;
};

Result<bool> invalid(const std::string& detail) {
    return Result<bool>(ErrorKind::SnapshotInvalid, detail);
}

Currency require_currency(const json& value, std::string& error) {
    auto currency = parse_currency(value.get<std::string>());
    if (!currency.has_value()) {
        error = "unknown currency " + value.get<std::string>();
        return Currency::STX;
    }
    return *currency;
}

Result<bool> decode_listings(const json& snapshot, DecodedSnapshot& out) {
    std::string error;

    for (const auto& entry : snapshot.at("listings")) {
        Listing listing;
        listing.id = common::require_u64(entry, "id");
        listing.item_hash = entry.at("item_hash").get<std::string>();
        listing.seller = entry.at("seller").get<std::string>();
        listing.price = common::require_u64(entry, "price");
        listing.category = entry.at("category").get<std::string>();
        listing.location = entry.at("location").get<std::string>();
        listing.currency = require_currency(entry.at("currency"), error);
        listing.created_at = common::require_u64(entry, "created_at");
        listing.paused_by_seller = entry.at("paused_by_seller").get<bool>();
        listing.closed = entry.at("closed").get<bool>();

        if (!error.empty()) {
            return invalid(error);
        }
        if (listing.id == 0 || listing.item_hash.size() != ITEM_HASH_LENGTH || listing.price == 0) {
            return invalid("malformed listing " + std::to_string(listing.id));
        }
        if (!out.listings.emplace(listing.id, listing).second) {
            return invalid("duplicate listing " + std::to_string(listing.id));
        }
    }

    for (const auto& entry : snapshot.at("listing_history").items()) {
        ListingId id = common::as_u64(entry.value(), "listing_history");
        auto it = out.listings.find(id);
        if (it == out.listings.end() || it->second.item_hash != entry.key()) {
            return invalid("history entry " + entry.key() + " does not match a listing");
        }
        out.history[entry.key()] = id;
    }
    if (out.history.size() != out.listings.size()) {
        return invalid("listing history is incomplete");
    }

    for (const auto& entry : snapshot.at("flagged_listings")) {
        FlaggedListing flag;
        flag.listing_id = common::require_u64(entry, "listing_id");
        flag.reason = entry.at("reason").get<std::string>();
        flag.timestamp = common::require_u64(entry, "timestamp");
        flag.risk_score = common::require_u64(entry, "risk_score");

        auto it = out.listings.find(flag.listing_id);
        if (it == out.listings.end()) {
            return invalid("flag for unknown listing " + std::to_string(flag.listing_id));
        }
        it->second.flag = flag;
    }

    for (const auto& entry : snapshot.at("risk_scores")) {
        ListingId id = common::require_u64(entry, "listing_id");
        auto it = out.listings.find(id);
        if (it == out.listings.end()) {
            return invalid("risk score for unknown listing " + std::to_string(id));
        }
        it->second.risk_score = common::require_u64(entry, "risk_score");
    }

    return Result<bool>(true);
}

Result<bool> decode_settlement(const json& snapshot, DecodedSnapshot& out) {
    std::string error;

    for (const auto& entry : snapshot.at("escrows")) {
        EscrowRecord escrow;
        escrow.escrow_id = common::require_u64(entry, "escrow_id");
        escrow.listing_id = common::require_u64(entry, "listing_id");
        escrow.buyer = entry.at("buyer").get<std::string>();
        escrow.seller = entry.at("seller").get<std::string>();
        escrow.amount = common::require_u64(entry, "amount");
        escrow.currency = require_currency(entry.at("currency"), error);
        escrow.opened_at = common::require_u64(entry, "opened_at");
        escrow.settled_at = common::require_u64(entry, "settled_at");

        auto state = parse_escrow_state(entry.at("state").get<std::string>());
        if (!error.empty()) {
            return invalid(error);
        }
        if (!state.has_value()) {
            return invalid("unknown escrow state in escrow " + std::to_string(escrow.escrow_id));
        }
        escrow.state = *state;

        if (out.listings.count(escrow.listing_id) == 0) {
            return invalid("escrow " + std::to_string(escrow.escrow_id) + " references unknown listing");
        }
        if (escrow.escrow_id == 0 || escrow.escrow_id >= out.next_escrow_id) {
            return invalid("escrow id " + std::to_string(escrow.escrow_id) + " out of range");
        }
        if (escrow.is_held() && !out.escrow_locks.insert(escrow.listing_id).second) {
            return invalid("listing " + std::to_string(escrow.listing_id) + " has two held escrows");
        }
        if (!out.escrows.emplace(escrow.escrow_id, escrow).second) {
            return invalid("duplicate escrow " + std::to_string(escrow.escrow_id));
        }
    }

    for (const auto& entry : snapshot.at("balances")) {
        Principal principal = entry.at("principal").get<std::string>();
        Currency currency = require_currency(entry.at("currency"), error);
        if (!error.empty()) {
            return invalid(error);
        }
        out.balances[BalanceKey(principal, currency)] = common::require_u64(entry, "amount");
    }

    for (const auto& entry : snapshot.at("disputes")) {
        Dispute dispute;
        dispute.dispute_id = common::require_u64(entry, "dispute_id");
        dispute.listing_id = common::require_u64(entry, "listing_id");
        dispute.escrow_id = common::require_u64(entry, "escrow_id");
        dispute.opened_by = entry.at("opened_by").get<std::string>();
        dispute.evidence_refs = entry.at("evidence_refs").get<std::vector<std::string>>();
        dispute.arbitrator = entry.at("arbitrator").get<std::string>();
        dispute.opened_at = common::require_u64(entry, "opened_at");
        dispute.ruled_at = common::require_u64(entry, "ruled_at");

        auto state = parse_dispute_state(entry.at("state").get<std::string>());
        if (!state.has_value()) {
            return invalid("unknown dispute state in dispute " + std::to_string(dispute.dispute_id));
        }
        dispute.state = *state;

        const json& ruling = entry.at("ruling");
        if (!ruling.is_null()) {
            dispute.ruling = parse_ruling(ruling.get<std::string>());
            if (!dispute.ruling.has_value()) {
                return invalid("unknown ruling in dispute " + std::to_string(dispute.dispute_id));
            }
        }
        if (dispute.ruling.has_value() != (dispute.state == DisputeState::Ruled)) {
            return invalid("ruling does not match state in dispute " + std::to_string(dispute.dispute_id));
        }

        auto escrow = out.escrows.find(dispute.escrow_id);
        if (escrow == out.escrows.end()) {
            return invalid("dispute " + std::to_string(dispute.dispute_id) + " references unknown escrow");
        }
        if (dispute.state == DisputeState::Open) {
            if (!escrow->second.is_held() || !out.disputed.insert(dispute.escrow_id).second) {
                return invalid("open dispute " + std::to_string(dispute.dispute_id) + " conflicts with escrow state");
            }
        }
        if (dispute.dispute_id == 0 || dispute.dispute_id >= out.next_dispute_id) {
            return invalid("dispute id " + std::to_string(dispute.dispute_id) + " out of range");
        }
        if (!out.disputes.emplace(dispute.dispute_id, dispute).second) {
            return invalid("duplicate dispute " + std::to_string(dispute.dispute_id));
        }
    }

    return Result<bool>(true);
}

Result<DecodedSnapshot> decode_snapshot(const json& snapshot) {
    try {
        if (!snapshot.is_object()) {
            return Result<DecodedSnapshot>(ErrorKind::SnapshotInvalid, "snapshot must be an object");
        }
        if (common::require_u64(snapshot, "version") != SNAPSHOT_VERSION) {
            return Result<DecodedSnapshot>(ErrorKind::SnapshotInvalid, "unsupported snapshot version");
        }

        DecodedSnapshot out;

        const json& authority = snapshot.at("authority");
        if (!authority.is_null()) {
            out.authority = authority.get<std::string>();
            if (out.authority->empty()) {
                return Result<DecodedSnapshot>(ErrorKind::SnapshotInvalid, "empty authority");
            }
        }

        const json& policy = snapshot.at("policy");
        out.policy.fraud_threshold = common::require_u64(policy, "fraud_threshold");
        out.policy.min_reputation = common::require_u64(policy, "min_reputation");
        out.policy.max_risk_score = common::require_u64(policy, "max_risk_score");
        out.policy.anomaly_detection_enabled = policy.at("anomaly_detection_enabled").get<bool>();

        out.blacklist = snapshot.at("blacklist").get<std::set<Principal>>();
        if (snapshot.contains("arbitrators")) {
            out.arbitrators = snapshot.at("arbitrators").get<std::set<Principal>>();
            if (out.arbitrators->count(Principal()) > 0) {
                return Result<DecodedSnapshot>(ErrorKind::SnapshotInvalid, "empty arbitrator");
            }
        }
        out.reputation = common::require_u64_map(snapshot.at("reputation"), "reputation");
        out.block_height = common::require_u64(snapshot, "block_height");
        out.next_escrow_id = common::require_u64(snapshot, "next_escrow_id");
        out.next_dispute_id = common::require_u64(snapshot, "next_dispute_id");

        auto listings = decode_listings(snapshot, out);
        if (listings.is_err()) {
            return Result<DecodedSnapshot>::propagate(listings);
        }
        auto settlement = decode_settlement(snapshot, out);
        if (settlement.is_err()) {
            return Result<DecodedSnapshot>::propagate(settlement);
        }

        return Result<DecodedSnapshot>(std::move(out));
    } catch (const json::exception& e) {
        return Result<DecodedSnapshot>(ErrorKind::SnapshotInvalid,
                                       "JSON parsing error: " + std::string(e.what()));
    } catch (const std::invalid_argument& e) {
        return Result<DecodedSnapshot>(ErrorKind::SnapshotInvalid, e.what());
    }
}

} // anonymous namespace

// ============================================================================
// TrustEngine Implementation
// ============================================================================

TrustEngine::TrustEngine()
    : policy_(access_),
      scoring_(policy_),
      registry_(policy_, scoring_, reputation_, clock_),
      escrow_(registry_, reputation_, clock_),
      disputes_(escrow_, &roster_, clock_) {}

Result<bool> TrustEngine::apply_config(const EngineConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Startup only: afterwards policy changes go through the authority-gated setters
    if (configured_ || access_.authority().has_value() || registry_.listing_count() > 0 ||
        !escrow_.escrows().empty()) {
        LOG_REJECTED("engine", "apply_config", ErrorKind::InvalidState);
        return Result<bool>(ErrorKind::InvalidState, "engine is already configured or in use");
    }

    std::string error = EngineConfigManager::validate_config(config);
    if (!error.empty()) {
        return Result<bool>(ErrorKind::ConfigInvalid, error);
    }

    if (config.authority.has_value()) {
        auto authority = access_.set_authority(*config.authority);
        if (authority.is_err()) {
            return authority;
        }
    }

    policy_.restore(config.policy, policy_.blacklist());

    for (const auto& arbitrator : config.arbitrators) {
        roster_.add(arbitrator);
    }
    if (!config.registered_identities.empty()) {
        identity_ = std::make_shared<StaticIdentityRegistry>(config.registered_identities);
    }
    for (const auto& entry : config.initial_reputation) {
        reputation_.seed(entry.first, entry.second);
    }

    configured_ = true;
    LOG_INFO("engine", "Configured: ", config.arbitrators.size(), " arbitrators, ",
             config.registered_identities.size(), " registered identities, ",
             config.initial_reputation.size(), " seeded reputations");
    return Result<bool>(true);
}

void TrustEngine::attach_identity_provider(std::shared_ptr<IIdentityProvider> provider) {
    std::lock_guard<std::mutex> lock(mutex_);
    identity_ = std::move(provider);
}

void TrustEngine::attach_arbitrator_eligibility(std::shared_ptr<IArbitratorEligibility> eligibility) {
    std::lock_guard<std::mutex> lock(mutex_);
    eligibility_ = std::move(eligibility);
    disputes_.set_eligibility(eligibility_ ? eligibility_.get() : &roster_);
}

Result<bool> TrustEngine::check_identity(const Principal& caller) const {
    if (identity_ && !identity_->is_registered(caller)) {
        LOG_REJECTED("engine", "identity gate", ErrorKind::Unauthorized);
        return Result<bool>(ErrorKind::Unauthorized, "unregistered identity " + caller);
    }
    return Result<bool>(true);
}

// ============================================================================
// Configuration / Authority
// ============================================================================

Result<bool> TrustEngine::set_authority(const Principal& principal) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto identity = check_identity(principal);
    if (identity.is_err()) {
        return identity;
    }
    return access_.set_authority(principal);
}

Result<uint64_t> TrustEngine::set_fraud_threshold(const Principal& caller, uint64_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto identity = check_identity(caller);
    if (identity.is_err()) {
        return Result<uint64_t>::propagate(identity);
    }
    return policy_.set_fraud_threshold(caller, value);
}

Result<uint64_t> TrustEngine::set_min_reputation(const Principal& caller, uint64_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto identity = check_identity(caller);
    if (identity.is_err()) {
        return Result<uint64_t>::propagate(identity);
    }
    return policy_.set_min_reputation(caller, value);
}

Result<uint64_t> TrustEngine::set_max_risk_score(const Principal& caller, uint64_t value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto identity = check_identity(caller);
    if (identity.is_err()) {
        return Result<uint64_t>::propagate(identity);
    }
    return policy_.set_max_risk_score(caller, value);
}

Result<bool> TrustEngine::toggle_anomaly_detection(const Principal& caller) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto identity = check_identity(caller);
    if (identity.is_err()) {
        return identity;
    }
    return policy_.toggle_anomaly_detection(caller);
}

Result<bool> TrustEngine::blacklist_seller(const Principal& caller, const Principal& seller) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto identity = check_identity(caller);
    if (identity.is_err()) {
        return identity;
    }
    return policy_.blacklist_seller(caller, seller);
}

Result<bool> TrustEngine::unblacklist_seller(const Principal& caller, const Principal& seller) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto identity = check_identity(caller);
    if (identity.is_err()) {
        return identity;
    }
    return policy_.unblacklist_seller(caller, seller);
}

Result<bool> TrustEngine::add_arbitrator(const Principal& caller, const Principal& arbitrator) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto identity = check_identity(caller);
    if (identity.is_err()) {
        return identity;
    }
    auto allowed = access_.require_authority(caller);
    if (allowed.is_err()) {
        return allowed;
    }
    if (arbitrator.empty()) {
        LOG_REJECTED("engine", "add_arbitrator", ErrorKind::InvalidPrincipal);
        return Result<bool>(ErrorKind::InvalidPrincipal, "empty arbitrator");
    }

    bool changed = roster_.add(arbitrator);
    if (changed) {
        LOG_INFO("engine", "Arbitrator ", arbitrator, " added by ", caller);
    }
    return Result<bool>(changed);
}

Result<bool> TrustEngine::remove_arbitrator(const Principal& caller, const Principal& arbitrator) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto identity = check_identity(caller);
    if (identity.is_err()) {
        return identity;
    }
    auto allowed = access_.require_authority(caller);
    if (allowed.is_err()) {
        return allowed;
    }

    // Rulings already recorded stay valid; only future rulings are affected
    bool changed = roster_.remove(arbitrator);
    if (changed) {
        LOG_INFO("engine", "Arbitrator ", arbitrator, " removed by ", caller);
    }
    return Result<bool>(changed);
}

void TrustEngine::seed_reputation(const Principal& participant, ReputationPoints score) {
    std::lock_guard<std::mutex> lock(mutex_);
    reputation_.seed(participant, score);
}

// ============================================================================
// Listings
// ============================================================================

Result<ListingId> TrustEngine::submit_listing(const Principal& caller, const ListingDraft& draft) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto identity = check_identity(caller);
    if (identity.is_err()) {
        return Result<ListingId>::propagate(identity);
    }
    return registry_.submit_listing(caller, draft);
}

Result<bool> TrustEngine::flag_listing(const Principal& caller, ListingId id,
                                       const std::string& reason, uint64_t risk_score) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto identity = check_identity(caller);
    if (identity.is_err()) {
        return identity;
    }
    return registry_.flag_listing(caller, id, reason, risk_score);
}

Result<bool> TrustEngine::unflag_listing(const Principal& caller, ListingId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto identity = check_identity(caller);
    if (identity.is_err()) {
        return identity;
    }
    return registry_.unflag_listing(caller, id);
}

Result<Amount> TrustEngine::update_listing_price(const Principal& caller, ListingId id, Amount new_price) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto identity = check_identity(caller);
    if (identity.is_err()) {
        return Result<Amount>::propagate(identity);
    }
    return registry_.update_listing_price(caller, id, new_price);
}

Result<bool> TrustEngine::pause_listing(const Principal& caller, ListingId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto identity = check_identity(caller);
    if (identity.is_err()) {
        return identity;
    }
    return registry_.pause_listing(caller, id);
}

Result<bool> TrustEngine::resume_listing(const Principal& caller, ListingId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto identity = check_identity(caller);
    if (identity.is_err()) {
        return identity;
    }
    return registry_.resume_listing(caller, id);
}

Result<bool> TrustEngine::close_listing(const Principal& caller, ListingId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto identity = check_identity(caller);
    if (identity.is_err()) {
        return identity;
    }
    return registry_.close_listing(caller, id);
}

// ============================================================================
// Escrow and Disputes
// ============================================================================

Result<EscrowId> TrustEngine::open_escrow(const Principal& buyer, ListingId listing_id,
                                          Amount amount, Currency currency) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto identity = check_identity(buyer);
    if (identity.is_err()) {
        return Result<EscrowId>::propagate(identity);
    }
    return escrow_.open_escrow(buyer, listing_id, amount, currency);
}

Result<EscrowId> TrustEngine::confirm_receipt(const Principal& caller, ListingId listing_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto identity = check_identity(caller);
    if (identity.is_err()) {
        return Result<EscrowId>::propagate(identity);
    }
    return escrow_.confirm_receipt(caller, listing_id);
}

Result<DisputeId> TrustEngine::open_dispute(const Principal& caller, ListingId listing_id,
                                            const std::vector<std::string>& evidence_refs) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto identity = check_identity(caller);
    if (identity.is_err()) {
        return Result<DisputeId>::propagate(identity);
    }
    return disputes_.open_dispute(caller, listing_id, evidence_refs);
}

Result<uint64_t> TrustEngine::submit_evidence(const Principal& caller, DisputeId dispute_id,
                                              const std::string& evidence_ref) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto identity = check_identity(caller);
    if (identity.is_err()) {
        return Result<uint64_t>::propagate(identity);
    }
    return disputes_.submit_evidence(caller, dispute_id, evidence_ref);
}

Result<EscrowState> TrustEngine::rule_dispute(const Principal& caller, DisputeId dispute_id,
                                              Ruling ruling) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto identity = check_identity(caller);
    if (identity.is_err()) {
        return Result<EscrowState>::propagate(identity);
    }
    return disputes_.rule_dispute(caller, dispute_id, ruling);
}

// ============================================================================
// Reads
// ============================================================================

PolicyConfig TrustEngine::policy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return policy_.policy();
}

std::optional<Principal> TrustEngine::authority() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return access_.authority();
}

bool TrustEngine::is_blacklisted(const Principal& seller) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return policy_.is_blacklisted(seller);
}

std::optional<ReputationPoints> TrustEngine::reputation_of(const Principal& participant) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reputation_.get(participant);
}

std::vector<std::pair<Principal, ReputationPoints>> TrustEngine::top_reputation(size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reputation_.top(count);
}

bool TrustEngine::is_arbitrator(const Principal& principal) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return roster_.is_eligible(principal);
}

std::optional<Listing> TrustEngine::get_listing(ListingId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.get_listing(id);
}

std::optional<FlaggedListing> TrustEngine::get_flag(ListingId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.get_flag(id);
}

std::optional<uint64_t> TrustEngine::risk_score(ListingId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.risk_score(id);
}

std::optional<ListingId> TrustEngine::listing_for_hash(const std::string& item_hash) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.listing_for_hash(item_hash);
}

size_t TrustEngine::listing_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return registry_.listing_count();
}

std::optional<EscrowRecord> TrustEngine::get_escrow(EscrowId escrow_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return escrow_.get_escrow(escrow_id);
}

std::optional<EscrowRecord> TrustEngine::escrow_for_listing(ListingId listing_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return escrow_.escrow_for_listing(listing_id);
}

std::optional<EscrowRecord> TrustEngine::open_escrow_for_listing(ListingId listing_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return escrow_.open_escrow_for_listing(listing_id);
}

Amount TrustEngine::balance_of(const Principal& principal, Currency currency) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return escrow_.balance_of(principal, currency);
}

std::optional<Dispute> TrustEngine::get_dispute(DisputeId dispute_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disputes_.get_dispute(dispute_id);
}

std::optional<Dispute> TrustEngine::open_dispute_for_escrow(EscrowId escrow_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disputes_.open_dispute_for_escrow(escrow_id);
}

BlockHeight TrustEngine::advance_block_height(uint64_t blocks) {
    std::lock_guard<std::mutex> lock(mutex_);
    return clock_.advance(blocks);
}

BlockHeight TrustEngine::block_height() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clock_.height();
}

// ============================================================================
// Persistence
// ============================================================================

json TrustEngine::export_locked() const {
    json snapshot;
    snapshot["version"] = SNAPSHOT_VERSION;

    if (access_.authority().has_value()) {
        snapshot["authority"] = *access_.authority();
    } else {
        snapshot["authority"] = nullptr;
    }

    const PolicyConfig& config = policy_.policy();
    snapshot["policy"] = {
        {"fraud_threshold", config.fraud_threshold},
        {"min_reputation", config.min_reputation},
        {"max_risk_score", config.max_risk_score},
        {"anomaly_detection_enabled", config.anomaly_detection_enabled}
    };
    snapshot["blacklist"] = policy_.blacklist();
    snapshot["arbitrators"] = roster_.arbitrators();
    snapshot["listing_history"] = registry_.history();

    json listings = json::array();
    json flags = json::array();
    json risk_scores = json::array();
    for (const auto& entry : registry_.listings()) {
        const Listing& listing = entry.second;
        listings.push_back(listing_to_json(listing));
        if (listing.flag.has_value()) {
            flags.push_back(flag_to_json(*listing.flag));
        }
        if (listing.risk_score.has_value()) {
            risk_scores.push_back({{"listing_id", listing.id}, {"risk_score", *listing.risk_score}});
        }
    }
    snapshot["listings"] = listings;
    snapshot["flagged_listings"] = flags;
    snapshot["risk_scores"] = risk_scores;

    json escrows = json::array();
    for (const auto& entry : escrow_.escrows()) {
        escrows.push_back(escrow_to_json(entry.second));
    }
    snapshot["escrows"] = escrows;

    json balances = json::array();
    for (const auto& entry : escrow_.balances()) {
        balances.push_back({
            {"principal", entry.first.first},
            {"currency", to_string(entry.first.second)},
            {"amount", entry.second}
        });
    }
    snapshot["balances"] = balances;

    json disputes = json::array();
    for (const auto& entry : disputes_.disputes()) {
        disputes.push_back(dispute_to_json(entry.second));
    }
    snapshot["disputes"] = disputes;

    snapshot["reputation"] = reputation_.scores();
    snapshot["block_height"] = clock_.height();
    snapshot["next_escrow_id"] = escrow_.next_escrow_id();
    snapshot["next_dispute_id"] = disputes_.next_dispute_id();

    return snapshot;
}

json TrustEngine::export_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return export_locked();
}

Result<bool> TrustEngine::import_snapshot(const json& snapshot) {
    auto decoded = decode_snapshot(snapshot);
    if (decoded.is_err()) {
        LOG_WARN("engine", "Snapshot rejected: ", decoded.error());
        return Result<bool>::propagate(decoded);
    }
    DecodedSnapshot state = std::move(decoded).value();

    std::lock_guard<std::mutex> lock(mutex_);
    auto current = access_.authority();
    if (current.has_value() && state.authority != current) {
        LOG_WARN("engine", "Snapshot rejected: authority ", *current, " is already set");
        return Result<bool>(ErrorKind::AlreadySet, "snapshot authority differs from " + *current);
    }

    access_.restore(state.authority);
    policy_.restore(state.policy, std::move(state.blacklist));
    reputation_.restore(std::move(state.reputation));
    registry_.restore(std::move(state.listings), std::move(state.history),
                      std::move(state.escrow_locks));
    escrow_.restore(std::move(state.escrows), std::move(state.balances),
                    state.next_escrow_id, std::move(state.disputed));
    disputes_.restore(std::move(state.disputes), state.next_dispute_id);
    if (state.arbitrators.has_value()) {
        roster_.restore(std::move(*state.arbitrators));
    }
    clock_.restore(state.block_height);
    configured_ = true;

    LOG_INFO("engine", "Snapshot imported at block height ", state.block_height);
    return Result<bool>(true);
}

Result<bool> TrustEngine::save_snapshot(const std::string& path) const {
    std::string document = export_snapshot().dump(2);

    std::ofstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("engine", "Cannot write snapshot to ", path);
        return Result<bool>(ErrorKind::IoError, path);
    }
    file << document << std::endl;
    if (!file.good()) {
        return Result<bool>(ErrorKind::IoError, path);
    }
    return Result<bool>(true);
}

Result<bool> TrustEngine::load_snapshot(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        LOG_ERROR("engine", "Cannot read snapshot from ", path);
        return Result<bool>(ErrorKind::IoError, path);
    }

    json snapshot = json::parse(file, nullptr, false);
    if (snapshot.is_discarded()) {
        return Result<bool>(ErrorKind::SnapshotInvalid, "not valid JSON: " + path);
    }
    return import_snapshot(snapshot);
}

std::string TrustEngine::state_digest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return common::hashing::sha256_hex(export_locked().dump());
}

} // namespace market
} // namespace tradeguard
