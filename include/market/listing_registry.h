#pragma once

#include "market/fraud_scoring.h"
#include "market/policy.h"
#include "market/reputation_ledger.h"
#include "market/types.h"

#include <map>
#include <optional>
#include <set>
#include <string>

namespace tradeguard {
namespace market {

/**
 * Listing admission, moderation and seller-side lifecycle.
 *
 * Owns the listings, the append-only item hash history and the flag
 * records. Every operation checks all preconditions before touching state,
 * so a failed call commits nothing.
 */
class ListingRegistry {
public:
    ListingRegistry(const PolicyStore& policy,
                    const FraudScoringEngine& scoring,
                    const ReputationLedger& reputation,
                    const BlockClock& clock);

    /**
     * Admit a new listing.
     *
     * Checks run in a fixed order and the first failure is returned:
     * id, item hash, seller, reputation, price, category, location,
     * currency, hash history, blacklist, id uniqueness, then the risk score.
     *
     * @param caller Submitting principal; must differ from draft.seller
     * @param draft Listing fields as submitted
     * @return The listing id on success
     */
    Result<ListingId> submit_listing(const Principal& caller, const ListingDraft& draft);

    /**
     * Suspend a listing pending review (authority only).
     * Re-flagging overwrites the existing record.
     */
    Result<bool> flag_listing(const Principal& caller, ListingId id,
                              const std::string& reason, uint64_t risk_score);

    /**
     * Lift a flag (authority only). Also clears any seller pause.
     */
    Result<bool> unflag_listing(const Principal& caller, ListingId id);

    /**
     * Change the price (seller only). The stored risk score is not
     * recomputed.
     * @return The new price
     */
    Result<Amount> update_listing_price(const Principal& caller, ListingId id, Amount new_price);

    Result<bool> pause_listing(const Principal& caller, ListingId id);
    Result<bool> resume_listing(const Principal& caller, ListingId id);

    /**
     * Withdraw a listing permanently (seller only). The item hash stays in
     * history.
     */
    Result<bool> close_listing(const Principal& caller, ListingId id);

    // Reads
    std::optional<Listing> get_listing(ListingId id) const;
    std::optional<FlaggedListing> get_flag(ListingId id) const;
    std::optional<uint64_t> risk_score(ListingId id) const;
    std::optional<ListingId> listing_for_hash(const std::string& item_hash) const;
    size_t listing_count() const { return listings_.size(); }

    // Hooks for EscrowSettlement
    void lock_for_escrow(ListingId id);
    void unlock_escrow(ListingId id);
    bool has_escrow_lock(ListingId id) const;
    void close_after_settlement(ListingId id);

    // Snapshot support
    const std::map<ListingId, Listing>& listings() const { return listings_; }
    const std::map<std::string, ListingId>& history() const { return history_; }
    void restore(std::map<ListingId, Listing> listings,
                 std::map<std::string, ListingId> history,
                 std::set<ListingId> escrow_locks);

private:
    Result<Listing*> find_owned(const Principal& caller, ListingId id, const char* operation);

    const PolicyStore& policy_;
    const FraudScoringEngine& scoring_;
    const ReputationLedger& reputation_;
    const BlockClock& clock_;

    std::map<ListingId, Listing> listings_;
    std::map<std::string, ListingId> history_;
    std::set<ListingId> escrow_locks_;
};

} // namespace market
} // namespace tradeguard
