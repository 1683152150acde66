#pragma once

#include "market/collaborators.h"
#include "market/escrow_settlement.h"
#include "market/types.h"

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tradeguard {
namespace market {

/**
 * Disputes over Held escrows. Funds stay Held until an eligible arbitrator
 * rules; the ruling is then applied through EscrowSettlement::settle.
 */
class DisputeArbitration {
public:
    DisputeArbitration(EscrowSettlement& escrow,
                       const IArbitratorEligibility* eligibility,
                       const BlockClock& clock);

    /**
     * Open a dispute on the Held escrow of a listing (buyer or seller).
     * @return The new dispute id
     */
    Result<DisputeId> open_dispute(const Principal& caller, ListingId listing_id,
                                   const std::vector<std::string>& evidence_refs);

    /// @return The number of evidence refs after appending
    Result<uint64_t> submit_evidence(const Principal& caller, DisputeId dispute_id,
                                     const std::string& evidence_ref);

    /**
     * Record a ruling and settle the escrow.
     * @return The resulting escrow state
     */
    Result<EscrowState> rule_dispute(const Principal& caller, DisputeId dispute_id, Ruling ruling);

    std::optional<Dispute> get_dispute(DisputeId dispute_id) const;
    std::optional<Dispute> open_dispute_for_escrow(EscrowId escrow_id) const;

    /// nullptr makes every ruling fail Unauthorized
    void set_eligibility(const IArbitratorEligibility* eligibility) { eligibility_ = eligibility; }

    // Snapshot support
    const std::map<DisputeId, Dispute>& disputes() const { return disputes_; }
    DisputeId next_dispute_id() const { return next_dispute_id_; }
    void restore(std::map<DisputeId, Dispute> disputes, DisputeId next_dispute_id);

private:
    static bool valid_evidence_ref(const std::string& ref);

    EscrowSettlement& escrow_;
    const IArbitratorEligibility* eligibility_;
    const BlockClock& clock_;

    std::map<DisputeId, Dispute> disputes_;
    std::map<EscrowId, DisputeId> open_by_escrow_;
    DisputeId next_dispute_id_ = 1;
};

} // namespace market
} // namespace tradeguard
