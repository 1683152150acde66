#include "market/listing_registry.h"
#include "common/logging.h"

namespace tradeguard {
namespace market {

ListingRegistry::ListingRegistry(
    const PolicyStore& policy,
    const FraudScoringEngine& scoring,
    const ReputationLedger& reputation,
    const BlockClock& clock
) : policy_(policy), scoring_(scoring), reputation_(reputation), clock_(clock) {}

// ============================================================================
// Admission
// ============================================================================

Result<ListingId> ListingRegistry::submit_listing(
    const Principal& caller,
    const ListingDraft& draft
) {
    auto reject = [&](ErrorKind kind) {
        LOG_REJECTED("registry", "submit_listing", kind);
        return Result<ListingId>(kind);
    };

    const PolicyConfig& config = policy_.policy();

    if (draft.id == 0) {
        return reject(ErrorKind::InvalidListingId);
    }
    if (draft.item_hash.size() != ITEM_HASH_LENGTH) {
        return reject(ErrorKind::InvalidItemHash);
    }
    if (draft.seller == caller) {
        return reject(ErrorKind::InvalidSellerDid);
    }

    std::optional<ReputationPoints> reputation = draft.seller_reputation;
    if (!reputation.has_value()) {
        reputation = reputation_.get(draft.seller);
    }
    if (!reputation.has_value() || *reputation < config.min_reputation) {
        return reject(ErrorKind::InsufficientReputation);
    }

    if (draft.price == 0) {
        return reject(ErrorKind::InvalidPrice);
    }
    if (draft.category.empty() || draft.category.size() > MAX_CATEGORY_LENGTH) {
        return reject(ErrorKind::InvalidCategory);
    }
    if (draft.location.empty() || draft.location.size() > MAX_LOCATION_LENGTH) {
        return reject(ErrorKind::InvalidLocation);
    }

    auto currency = parse_currency(draft.currency);
    if (!currency.has_value()) {
        return reject(ErrorKind::InvalidCurrency);
    }
    if (history_.count(draft.item_hash) > 0) {
        return reject(ErrorKind::DuplicateHash);
    }
    if (policy_.is_blacklisted(draft.seller)) {
        return reject(ErrorKind::BlacklistedSeller);
    }
    if (listings_.count(draft.id) > 0) {
        return reject(ErrorKind::DuplicateListingId);
    }

    RiskAssessment assessment = scoring_.assess(draft.price, *reputation, draft.category);
    if (assessment.exceeds_threshold) {
        LOG_STRUCTURED(LogLevel::DEBUG, "registry", "submit_listing rejected",
                       to_string(ErrorKind::AnomalyDetected),
                       {{"listing_id", std::to_string(draft.id)},
                        {"risk_score", std::to_string(*assessment.score)},
                        {"max_risk_score", std::to_string(config.max_risk_score)}});
        return Result<ListingId>(ErrorKind::AnomalyDetected);
    }

    Listing listing;
    listing.id = draft.id;
    listing.item_hash = draft.item_hash;
    listing.seller = draft.seller;
    listing.price = draft.price;
    listing.category = draft.category;
    listing.location = draft.location;
    listing.currency = *currency;
    listing.risk_score = assessment.score;
    listing.created_at = clock_.height();

    listings_[listing.id] = listing;
    history_[listing.item_hash] = listing.id;

    LOG_DEBUG("registry", "Admitted listing ", listing.id, " seller=", listing.seller,
              " price=", listing.price, " ", to_string(listing.currency));
    return Result<ListingId>(listing.id);
}

// ============================================================================
// Moderation
// ============================================================================

Result<bool> ListingRegistry::flag_listing(
    const Principal& caller,
    ListingId id,
    const std::string& reason,
    uint64_t risk_score
) {
    auto allowed = policy_.access().require_authority(caller);
    if (allowed.is_err()) {
        return allowed;
    }

    auto it = listings_.find(id);
    if (it == listings_.end()) {
        LOG_REJECTED("registry", "flag_listing", ErrorKind::ListingNotFound);
        return Result<bool>(ErrorKind::ListingNotFound);
    }
    if (risk_score > policy_.policy().max_risk_score) {
        LOG_REJECTED("registry", "flag_listing", ErrorKind::InvalidRiskScore);
        return Result<bool>(ErrorKind::InvalidRiskScore);
    }
    if (it->second.closed) {
        LOG_REJECTED("registry", "flag_listing", ErrorKind::InvalidState);
        return Result<bool>(ErrorKind::InvalidState, "listing is closed");
    }

    FlaggedListing flag;
    flag.listing_id = id;
    flag.reason = reason;
    flag.timestamp = clock_.height();
    flag.risk_score = risk_score;
    it->second.flag = flag;

    LOG_INFO("registry", "Flagged listing ", id, " risk_score=", risk_score, " reason=", reason);
    return Result<bool>(true);
}

Result<bool> ListingRegistry::unflag_listing(const Principal& caller, ListingId id) {
    auto allowed = policy_.access().require_authority(caller);
    if (allowed.is_err()) {
        return allowed;
    }

    auto it = listings_.find(id);
    if (it == listings_.end()) {
        LOG_REJECTED("registry", "unflag_listing", ErrorKind::ListingNotFound);
        return Result<bool>(ErrorKind::ListingNotFound);
    }
    if (!it->second.is_flagged()) {
        LOG_REJECTED("registry", "unflag_listing", ErrorKind::InvalidState);
        return Result<bool>(ErrorKind::InvalidState, "listing is not flagged");
    }

    it->second.flag.reset();
    it->second.paused_by_seller = false;

    LOG_INFO("registry", "Unflagged listing ", id);
    return Result<bool>(true);
}

// ============================================================================
// Seller Operations
// ============================================================================

Result<Listing*> ListingRegistry::find_owned(
    const Principal& caller,
    ListingId id,
    const char* operation
) {
    auto it = listings_.find(id);
    if (it == listings_.end()) {
        LOG_REJECTED("registry", operation, ErrorKind::ListingNotFound);
        return Result<Listing*>(ErrorKind::ListingNotFound);
    }
    if (it->second.seller != caller) {
        LOG_REJECTED("registry", operation, ErrorKind::Unauthorized);
        return Result<Listing*>(ErrorKind::Unauthorized, "caller is not the seller");
    }
    return Result<Listing*>(&it->second);
}

Result<Amount> ListingRegistry::update_listing_price(
    const Principal& caller,
    ListingId id,
    Amount new_price
) {
    auto found = find_owned(caller, id, "update_listing_price");
    if (found.is_err()) {
        return Result<Amount>::propagate(found);
    }
    Listing* listing = found.value();

    if (new_price == 0) {
        LOG_REJECTED("registry", "update_listing_price", ErrorKind::InvalidPrice);
        return Result<Amount>(ErrorKind::InvalidPrice);
    }
    if (listing->closed || has_escrow_lock(id)) {
        LOG_REJECTED("registry", "update_listing_price", ErrorKind::InvalidState);
        return Result<Amount>(ErrorKind::InvalidState,
                              listing->closed ? "listing is closed" : "escrow is held");
    }

    listing->price = new_price;
    LOG_DEBUG("registry", "Listing ", id, " price=", new_price);
    return Result<Amount>(new_price);
}

Result<bool> ListingRegistry::pause_listing(const Principal& caller, ListingId id) {
    auto found = find_owned(caller, id, "pause_listing");
    if (found.is_err()) {
        return Result<bool>::propagate(found);
    }
    Listing* listing = found.value();

    if (listing->status() != ListingStatus::Active) {
        LOG_REJECTED("registry", "pause_listing", ErrorKind::InvalidState);
        return Result<bool>(ErrorKind::InvalidState, to_string(listing->status()));
    }

    listing->paused_by_seller = true;
    LOG_DEBUG("registry", "Seller paused listing ", id);
    return Result<bool>(true);
}

Result<bool> ListingRegistry::resume_listing(const Principal& caller, ListingId id) {
    auto found = find_owned(caller, id, "resume_listing");
    if (found.is_err()) {
        return Result<bool>::propagate(found);
    }
    Listing* listing = found.value();

    if (listing->is_flagged()) {
        LOG_REJECTED("registry", "resume_listing", ErrorKind::InvalidState);
        return Result<bool>(ErrorKind::InvalidState, "listing is flagged");
    }
    if (listing->status() != ListingStatus::Paused) {
        LOG_REJECTED("registry", "resume_listing", ErrorKind::InvalidState);
        return Result<bool>(ErrorKind::InvalidState, to_string(listing->status()));
    }

    listing->paused_by_seller = false;
    LOG_DEBUG("registry", "Seller resumed listing ", id);
    return Result<bool>(true);
}

Result<bool> ListingRegistry::close_listing(const Principal& caller, ListingId id) {
    auto found = find_owned(caller, id, "close_listing");
    if (found.is_err()) {
        return Result<bool>::propagate(found);
    }
    Listing* listing = found.value();

    if (listing->closed || has_escrow_lock(id)) {
        LOG_REJECTED("registry", "close_listing", ErrorKind::InvalidState);
        return Result<bool>(ErrorKind::InvalidState,
                            listing->closed ? "listing is closed" : "escrow is held");
    }

    listing->closed = true;
    LOG_DEBUG("registry", "Seller closed listing ", id);
    return Result<bool>(true);
}

// ============================================================================
// Reads
// ============================================================================

std::optional<Listing> ListingRegistry::get_listing(ListingId id) const {
    auto it = listings_.find(id);
    if (it == listings_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<FlaggedListing> ListingRegistry::get_flag(ListingId id) const {
    auto it = listings_.find(id);
    if (it == listings_.end()) {
        return std::nullopt;
    }
    return it->second.flag;
}

std::optional<uint64_t> ListingRegistry::risk_score(ListingId id) const {
    auto it = listings_.find(id);
    if (it == listings_.end()) {
        return std::nullopt;
    }
    return it->second.risk_score;
}

std::optional<ListingId> ListingRegistry::listing_for_hash(const std::string& item_hash) const {
    auto it = history_.find(item_hash);
    if (it == history_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// Settlement Hooks
// ============================================================================

void ListingRegistry::lock_for_escrow(ListingId id) {
    escrow_locks_.insert(id);
}

void ListingRegistry::unlock_escrow(ListingId id) {
    escrow_locks_.erase(id);
}

bool ListingRegistry::has_escrow_lock(ListingId id) const {
    return escrow_locks_.count(id) > 0;
}

void ListingRegistry::close_after_settlement(ListingId id) {
    auto it = listings_.find(id);
    if (it != listings_.end()) {
        it->second.closed = true;
    }
}

void ListingRegistry::restore(
    std::map<ListingId, Listing> listings,
    std::map<std::string, ListingId> history,
    std::set<ListingId> escrow_locks
) {
    listings_ = std::move(listings);
    history_ = std::move(history);
    escrow_locks_ = std::move(escrow_locks);
}

} // namespace market
} // namespace tradeguard
