#include "market/escrow_settlement.h"
#include "common/logging.h"
#include <limits>

namespace tradeguard {
namespace market {

EscrowSettlement::EscrowSettlement(
    ListingRegistry& registry,
    ReputationLedger& reputation,
    const BlockClock& clock
) : registry_(registry), reputation_(reputation), clock_(clock) {}

Result<EscrowId> EscrowSettlement::open_escrow(
    const Principal& buyer,
    ListingId listing_id,
    Amount amount,
    Currency currency
) {
    auto listing = registry_.get_listing(listing_id);
    if (!listing.has_value()) {
        LOG_REJECTED("escrow", "open_escrow", ErrorKind::ListingNotFound);
        return Result<EscrowId>(ErrorKind::ListingNotFound);
    }
    if (listing->status() != ListingStatus::Active) {
        LOG_REJECTED("escrow", "open_escrow", ErrorKind::InvalidState);
        return Result<EscrowId>(ErrorKind::InvalidState, to_string(listing->status()));
    }
    if (open_escrow_for_listing(listing_id).has_value()) {
        LOG_REJECTED("escrow", "open_escrow", ErrorKind::InvalidState);
        return Result<EscrowId>(ErrorKind::InvalidState, "escrow already held");
    }
    if (buyer == listing->seller) {
        LOG_REJECTED("escrow", "open_escrow", ErrorKind::InvalidSellerDid);
        return Result<EscrowId>(ErrorKind::InvalidSellerDid, "buyer is the seller");
    }
    if (amount != listing->price || currency != listing->currency) {
        LOG_REJECTED("escrow", "open_escrow", ErrorKind::EscrowMismatch);
        return Result<EscrowId>(ErrorKind::EscrowMismatch);
    }

    EscrowRecord escrow;
    escrow.escrow_id = next_escrow_id_++;
    escrow.listing_id = listing_id;
    escrow.buyer = buyer;
    escrow.seller = listing->seller;
    escrow.amount = amount;
    escrow.currency = currency;
    escrow.state = EscrowState::Held;
    escrow.opened_at = clock_.height();

    escrows_[escrow.escrow_id] = escrow;
    latest_by_listing_[listing_id] = escrow.escrow_id;
    registry_.lock_for_escrow(listing_id);

    LOG_INFO("escrow", "Escrow ", escrow.escrow_id, " held for listing ", listing_id,
             ": ", amount, " ", to_string(currency), " from ", buyer);
    return Result<EscrowId>(escrow.escrow_id);
}

Result<EscrowId> EscrowSettlement::confirm_receipt(const Principal& caller, ListingId listing_id) {
    auto latest = latest_by_listing_.find(listing_id);
    auto it = latest == latest_by_listing_.end() ? escrows_.end() : escrows_.find(latest->second);
    if (it == escrows_.end() || !it->second.is_held()) {
        LOG_REJECTED("escrow", "confirm_receipt", ErrorKind::NoOpenEscrow);
        return Result<EscrowId>(ErrorKind::NoOpenEscrow);
    }

    EscrowRecord& escrow = it->second;
    if (escrow.buyer != caller) {
        LOG_REJECTED("escrow", "confirm_receipt", ErrorKind::Unauthorized);
        return Result<EscrowId>(ErrorKind::Unauthorized, "caller is not the buyer");
    }
    if (is_disputed(escrow.escrow_id)) {
        LOG_REJECTED("escrow", "confirm_receipt", ErrorKind::InvalidState);
        return Result<EscrowId>(ErrorKind::InvalidState, "dispute is open");
    }

    release(escrow);
    return Result<EscrowId>(escrow.escrow_id);
}

Result<EscrowState> EscrowSettlement::settle(EscrowId escrow_id, Ruling ruling) {
    auto it = escrows_.find(escrow_id);
    if (it == escrows_.end() || !it->second.is_held()) {
        LOG_REJECTED("escrow", "settle", ErrorKind::NoOpenEscrow);
        return Result<EscrowState>(ErrorKind::NoOpenEscrow);
    }

    if (ruling == Ruling::Release) {
        release(it->second);
    } else {
        refund(it->second);
    }
    return Result<EscrowState>(it->second.state);
}

void EscrowSettlement::release(EscrowRecord& escrow) {
    escrow.state = EscrowState::Released;
    escrow.settled_at = clock_.height();

    credit(escrow.seller, escrow.currency, escrow.amount);
    reputation_.apply_outcome(escrow.seller, ReputationOutcome::Fulfilled);
    reputation_.apply_outcome(escrow.buyer, ReputationOutcome::Fulfilled);

    registry_.unlock_escrow(escrow.listing_id);
    registry_.close_after_settlement(escrow.listing_id);

    LOG_INFO("escrow", "Escrow ", escrow.escrow_id, " released to ", escrow.seller);
}

void EscrowSettlement::refund(EscrowRecord& escrow) {
    escrow.state = EscrowState::Refunded;
    escrow.settled_at = clock_.height();

    credit(escrow.buyer, escrow.currency, escrow.amount);
    reputation_.apply_outcome(escrow.seller, ReputationOutcome::FraudSuspected);

    registry_.unlock_escrow(escrow.listing_id);

    LOG_INFO("escrow", "Escrow ", escrow.escrow_id, " refunded to ", escrow.buyer);
}

void EscrowSettlement::credit(const Principal& principal, Currency currency, Amount amount) {
    Amount& balance = balances_[BalanceKey(principal, currency)];
    if (balance > std::numeric_limits<Amount>::max() - amount) {
        LOG_WARN("escrow", "Balance of ", principal, " saturated in ", to_string(currency));
        balance = std::numeric_limits<Amount>::max();
    } else {
        balance += amount;
    }
}

std::optional<EscrowRecord> EscrowSettlement::get_escrow(EscrowId escrow_id) const {
    auto it = escrows_.find(escrow_id);
    if (it == escrows_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<EscrowRecord> EscrowSettlement::escrow_for_listing(ListingId listing_id) const {
    auto latest = latest_by_listing_.find(listing_id);
    if (latest == latest_by_listing_.end()) {
        return std::nullopt;
    }
    return get_escrow(latest->second);
}

std::optional<EscrowRecord> EscrowSettlement::open_escrow_for_listing(ListingId listing_id) const {
    auto escrow = escrow_for_listing(listing_id);
    if (!escrow.has_value() || !escrow->is_held()) {
        return std::nullopt;
    }
    return escrow;
}

Amount EscrowSettlement::balance_of(const Principal& principal, Currency currency) const {
    auto it = balances_.find(BalanceKey(principal, currency));
    return it == balances_.end() ? 0 : it->second;
}

void EscrowSettlement::restore(
    std::map<EscrowId, EscrowRecord> escrows,
    std::map<BalanceKey, Amount> balances,
    EscrowId next_escrow_id,
    std::set<EscrowId> disputed
) {
    escrows_ = std::move(escrows);
    balances_ = std::move(balances);
    next_escrow_id_ = next_escrow_id;
    disputed_ = std::move(disputed);

    // Escrow ids grow monotonically, so the last id seen per listing is the latest
    latest_by_listing_.clear();
    for (const auto& entry : escrows_) {
        latest_by_listing_[entry.second.listing_id] = entry.first;
    }
}

} // namespace market
} // namespace tradeguard
