#include "market/dispute_arbitration.h"
#include "common/logging.h"

namespace tradeguard {
namespace market {

DisputeArbitration::DisputeArbitration(
    EscrowSettlement& escrow,
    const IArbitratorEligibility* eligibility,
    const BlockClock& clock
) : escrow_(escrow), eligibility_(eligibility), clock_(clock) {}

bool DisputeArbitration::valid_evidence_ref(const std::string& ref) {
    return !ref.empty() && ref.size() <= MAX_EVIDENCE_REF_LENGTH;
}

Result<DisputeId> DisputeArbitration::open_dispute(
    const Principal& caller,
    ListingId listing_id,
    const std::vector<std::string>& evidence_refs
) {
    auto held = escrow_.open_escrow_for_listing(listing_id);
    if (!held.has_value()) {
        LOG_REJECTED("dispute", "open_dispute", ErrorKind::NoOpenEscrow);
        return Result<DisputeId>(ErrorKind::NoOpenEscrow);
    }
    if (!held->is_party(caller)) {
        LOG_REJECTED("dispute", "open_dispute", ErrorKind::Unauthorized);
        return Result<DisputeId>(ErrorKind::Unauthorized, "caller is not a party");
    }
    if (open_by_escrow_.count(held->escrow_id) > 0) {
        LOG_REJECTED("dispute", "open_dispute", ErrorKind::DuplicateDispute);
        return Result<DisputeId>(ErrorKind::DuplicateDispute);
    }
    for (const auto& ref : evidence_refs) {
        if (!valid_evidence_ref(ref)) {
            LOG_REJECTED("dispute", "open_dispute", ErrorKind::InvalidEvidenceRef);
            return Result<DisputeId>(ErrorKind::InvalidEvidenceRef);
        }
    }

    Dispute dispute;
    dispute.dispute_id = next_dispute_id_++;
    dispute.listing_id = listing_id;
    dispute.escrow_id = held->escrow_id;
    dispute.opened_by = caller;
    dispute.evidence_refs = evidence_refs;
    dispute.state = DisputeState::Open;
    dispute.opened_at = clock_.height();

    disputes_[dispute.dispute_id] = dispute;
    open_by_escrow_[dispute.escrow_id] = dispute.dispute_id;
    escrow_.mark_disputed(dispute.escrow_id);

    LOG_INFO("dispute", "Dispute ", dispute.dispute_id, " opened on escrow ",
             dispute.escrow_id, " by ", caller);
    return Result<DisputeId>(dispute.dispute_id);
}

Result<uint64_t> DisputeArbitration::submit_evidence(
    const Principal& caller,
    DisputeId dispute_id,
    const std::string& evidence_ref
) {
    auto it = disputes_.find(dispute_id);
    if (it == disputes_.end()) {
        LOG_REJECTED("dispute", "submit_evidence", ErrorKind::DisputeNotFound);
        return Result<uint64_t>(ErrorKind::DisputeNotFound);
    }

    Dispute& dispute = it->second;
    auto escrow = escrow_.get_escrow(dispute.escrow_id);
    if (!escrow.has_value() || !escrow->is_party(caller)) {
        LOG_REJECTED("dispute", "submit_evidence", ErrorKind::Unauthorized);
        return Result<uint64_t>(ErrorKind::Unauthorized, "caller is not a party");
    }
    if (dispute.state == DisputeState::Ruled) {
        LOG_REJECTED("dispute", "submit_evidence", ErrorKind::AlreadyRuled);
        return Result<uint64_t>(ErrorKind::AlreadyRuled);
    }
    if (!valid_evidence_ref(evidence_ref)) {
        LOG_REJECTED("dispute", "submit_evidence", ErrorKind::InvalidEvidenceRef);
        return Result<uint64_t>(ErrorKind::InvalidEvidenceRef);
    }

    dispute.evidence_refs.push_back(evidence_ref);
    LOG_DEBUG("dispute", "Evidence ", evidence_ref, " added to dispute ", dispute_id);
    return Result<uint64_t>(dispute.evidence_refs.size());
}

Result<EscrowState> DisputeArbitration::rule_dispute(
    const Principal& caller,
    DisputeId dispute_id,
    Ruling ruling
) {
    auto it = disputes_.find(dispute_id);
    if (it == disputes_.end()) {
        LOG_REJECTED("dispute", "rule_dispute", ErrorKind::DisputeNotFound);
        return Result<EscrowState>(ErrorKind::DisputeNotFound);
    }
    if (eligibility_ == nullptr || !eligibility_->is_eligible(caller)) {
        LOG_REJECTED("dispute", "rule_dispute", ErrorKind::Unauthorized);
        return Result<EscrowState>(ErrorKind::Unauthorized, "caller is not an eligible arbitrator");
    }

    Dispute& dispute = it->second;
    if (dispute.state == DisputeState::Ruled) {
        LOG_REJECTED("dispute", "rule_dispute", ErrorKind::AlreadyRuled);
        return Result<EscrowState>(ErrorKind::AlreadyRuled);
    }

    auto settled = escrow_.settle(dispute.escrow_id, ruling);
    if (settled.is_err()) {
        return settled;
    }

    dispute.state = DisputeState::Ruled;
    dispute.ruling = ruling;
    dispute.arbitrator = caller;
    dispute.ruled_at = clock_.height();
    open_by_escrow_.erase(dispute.escrow_id);
    escrow_.clear_disputed(dispute.escrow_id);

    LOG_INFO("dispute", "Dispute ", dispute_id, " ruled ", to_string(ruling), " by ", caller);
    return settled;
}

std::optional<Dispute> DisputeArbitration::get_dispute(DisputeId dispute_id) const {
    auto it = disputes_.find(dispute_id);
    if (it == disputes_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<Dispute> DisputeArbitration::open_dispute_for_escrow(EscrowId escrow_id) const {
    auto it = open_by_escrow_.find(escrow_id);
    if (it == open_by_escrow_.end()) {
        return std::nullopt;
    }
    return get_dispute(it->second);
}

void DisputeArbitration::restore(std::map<DisputeId, Dispute> disputes, DisputeId next_dispute_id) {
    disputes_ = std::move(disputes);
    next_dispute_id_ = next_dispute_id;

    open_by_escrow_.clear();
    for (const auto& entry : disputes_) {
        if (entry.second.state == DisputeState::Open) {
            open_by_escrow_[entry.second.escrow_id] = entry.first;
        }
    }
}

} // namespace market
} // namespace tradeguard
