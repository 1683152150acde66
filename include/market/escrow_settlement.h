#pragma once

#include "market/listing_registry.h"
#include "market/reputation_ledger.h"
#include "market/types.h"

#include <map>
#include <optional>
#include <set>
#include <utility>

namespace tradeguard {
namespace market {

/// Payout ledger key: (principal, currency)
using BalanceKey = std::pair<Principal, Currency>;

/**
 * Escrow state machine per listing: NoEscrow -> Held -> {Released | Refunded}.
 *
 * A listing has at most one Held record at a time. Settlement credits the
 * payout ledger and applies the reputation outcome in the same step.
 */
class EscrowSettlement {
public:
    EscrowSettlement(ListingRegistry& registry,
                     ReputationLedger& reputation,
                     const BlockClock& clock);

    /**
     * Hold buyer funds against an Active listing.
     * amount and currency must match the listing exactly.
     * @return The new escrow id
     */
    Result<EscrowId> open_escrow(const Principal& buyer, ListingId listing_id,
                                 Amount amount, Currency currency);

    /**
     * Buyer confirms delivery: Held -> Released, seller is credited, both
     * parties gain reputation and the listing is closed.
     * @return The released escrow id
     */
    Result<EscrowId> confirm_receipt(const Principal& caller, ListingId listing_id);

    /**
     * Apply an arbitration ruling to a Held escrow.
     * Release pays the seller and closes the listing; Refund pays the buyer
     * and penalises the seller.
     * @return The resulting escrow state
     */
    Result<EscrowState> settle(EscrowId escrow_id, Ruling ruling);

    // Reads
    std::optional<EscrowRecord> get_escrow(EscrowId escrow_id) const;
    std::optional<EscrowRecord> escrow_for_listing(ListingId listing_id) const;
    std::optional<EscrowRecord> open_escrow_for_listing(ListingId listing_id) const;
    Amount balance_of(const Principal& principal, Currency currency) const;

    // Hooks for DisputeArbitration
    void mark_disputed(EscrowId escrow_id) { disputed_.insert(escrow_id); }
    void clear_disputed(EscrowId escrow_id) { disputed_.erase(escrow_id); }
    bool is_disputed(EscrowId escrow_id) const { return disputed_.count(escrow_id) > 0; }

    // Snapshot support
    const std::map<EscrowId, EscrowRecord>& escrows() const { return escrows_; }
    const std::map<BalanceKey, Amount>& balances() const { return balances_; }
    EscrowId next_escrow_id() const { return next_escrow_id_; }
    void restore(std::map<EscrowId, EscrowRecord> escrows,
                 std::map<BalanceKey, Amount> balances,
                 EscrowId next_escrow_id,
                 std::set<EscrowId> disputed);

private:
    void release(EscrowRecord& escrow);
    void refund(EscrowRecord& escrow);
    void credit(const Principal& principal, Currency currency, Amount amount);

    ListingRegistry& registry_;
    ReputationLedger& reputation_;
    const BlockClock& clock_;

    std::map<EscrowId, EscrowRecord> escrows_;
    std::map<ListingId, EscrowId> latest_by_listing_;
    std::map<BalanceKey, Amount> balances_;
    std::set<EscrowId> disputed_;
    EscrowId next_escrow_id_ = 1;
};

} // namespace market
} // namespace tradeguard
