#pragma once

#include "market/collaborators.h"
#include "market/dispute_arbitration.h"
#include "market/engine_config.h"
#include "market/escrow_settlement.h"
#include "market/fraud_scoring.h"
#include "market/listing_registry.h"
#include "market/policy.h"
#include "market/reputation_ledger.h"

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tradeguard {
namespace market {

/// Layout version written into every snapshot
constexpr uint64_t SNAPSHOT_VERSION = 1;

/**
 * @brief Marketplace trust-and-settlement engine
 *
 * Owns one instance of every component, wired by reference, and exposes
 * their operations with the same contracts. Every public operation runs
 * under a single mutex, so operations on the same key observe submission
 * order and a check-then-transition is never interleaved with another call.
 *
 * When an identity provider is attached, every mutating operation fails
 * Unauthorized for callers it does not recognise.
 */
class TrustEngine {
public:
    TrustEngine();
    ~TrustEngine() = default;

    TrustEngine(const TrustEngine&) = delete;
    TrustEngine& operator=(const TrustEngine&) = delete;

    /**
     * Apply startup configuration: policy values, authority, arbitrators,
     * registered identities and seeded reputation.
     * Fails InvalidState once the engine has been configured, has an
     * authority, holds listings or escrows, or was loaded from a snapshot.
     */
    Result<bool> apply_config(const EngineConfig& config);

    // Collaborators
    void attach_identity_provider(std::shared_ptr<IIdentityProvider> provider);
    void attach_arbitrator_eligibility(std::shared_ptr<IArbitratorEligibility> eligibility);

    // Configuration / authority
    Result<bool> set_authority(const Principal& principal);
    Result<uint64_t> set_fraud_threshold(const Principal& caller, uint64_t value);
    Result<uint64_t> set_min_reputation(const Principal& caller, uint64_t value);
    Result<uint64_t> set_max_risk_score(const Principal& caller, uint64_t value);
    Result<bool> toggle_anomaly_detection(const Principal& caller);
    Result<bool> blacklist_seller(const Principal& caller, const Principal& seller);
    Result<bool> unblacklist_seller(const Principal& caller, const Principal& seller);

    /// Authority-only roster maintenance; @return true if the roster changed
    Result<bool> add_arbitrator(const Principal& caller, const Principal& arbitrator);
    Result<bool> remove_arbitrator(const Principal& caller, const Principal& arbitrator);

    // Reputation (host onboarding)
    void seed_reputation(const Principal& participant, ReputationPoints score);

    // Listings
    Result<ListingId> submit_listing(const Principal& caller, const ListingDraft& draft);
    Result<bool> flag_listing(const Principal& caller, ListingId id,
                              const std::string& reason, uint64_t risk_score);
    Result<bool> unflag_listing(const Principal& caller, ListingId id);
    Result<Amount> update_listing_price(const Principal& caller, ListingId id, Amount new_price);
    Result<bool> pause_listing(const Principal& caller, ListingId id);
    Result<bool> resume_listing(const Principal& caller, ListingId id);
    Result<bool> close_listing(const Principal& caller, ListingId id);

    // Escrow
    Result<EscrowId> open_escrow(const Principal& buyer, ListingId listing_id,
                                 Amount amount, Currency currency);
    Result<EscrowId> confirm_receipt(const Principal& caller, ListingId listing_id);

    // Disputes
    Result<DisputeId> open_dispute(const Principal& caller, ListingId listing_id,
                                   const std::vector<std::string>& evidence_refs);
    Result<uint64_t> submit_evidence(const Principal& caller, DisputeId dispute_id,
                                     const std::string& evidence_ref);
    Result<EscrowState> rule_dispute(const Principal& caller, DisputeId dispute_id, Ruling ruling);

    // Reads
    PolicyConfig policy() const;
    std::optional<Principal> authority() const;
    bool is_blacklisted(const Principal& seller) const;
    std::optional<ReputationPoints> reputation_of(const Principal& participant) const;
    std::vector<std::pair<Principal, ReputationPoints>> top_reputation(size_t count) const;
    /// Membership of the built-in roster, not of an attached eligibility source
    bool is_arbitrator(const Principal& principal) const;
    std::optional<Listing> get_listing(ListingId id) const;
    std::optional<FlaggedListing> get_flag(ListingId id) const;
    std::optional<uint64_t> risk_score(ListingId id) const;
    std::optional<ListingId> listing_for_hash(const std::string& item_hash) const;
    size_t listing_count() const;
    std::optional<EscrowRecord> get_escrow(EscrowId escrow_id) const;
    std::optional<EscrowRecord> escrow_for_listing(ListingId listing_id) const;
    std::optional<EscrowRecord> open_escrow_for_listing(ListingId listing_id) const;
    Amount balance_of(const Principal& principal, Currency currency) const;
    std::optional<Dispute> get_dispute(DisputeId dispute_id) const;
    std::optional<Dispute> open_dispute_for_escrow(EscrowId escrow_id) const;

    // Logical clock
    BlockHeight advance_block_height(uint64_t blocks);
    BlockHeight block_height() const;

    // Persistence
    nlohmann::json export_snapshot() const;

    /**
     * Replace the whole state with a snapshot.
     * The document is fully validated first; on failure the current state
     * is left untouched and SnapshotInvalid is returned. An engine whose
     * authority is set only accepts a snapshot with the same authority
     * (AlreadySet otherwise).
     */
    Result<bool> import_snapshot(const nlohmann::json& snapshot);

    Result<bool> save_snapshot(const std::string& path) const;
    Result<bool> load_snapshot(const std::string& path);

    /// SHA-256 hex of the canonical snapshot dump
    std::string state_digest() const;

private:
    Result<bool> check_identity(const Principal& caller) const;
    nlohmann::json export_locked() const;

    mutable std::mutex mutex_;

    BlockClock clock_;
    AccessControl access_;
    PolicyStore policy_;
    ReputationLedger reputation_;
    FraudScoringEngine scoring_;
    ListingRegistry registry_;
    EscrowSettlement escrow_;
    ArbitratorRoster roster_;
    DisputeArbitration disputes_;

    std::shared_ptr<IIdentityProvider> identity_;
    std::shared_ptr<IArbitratorEligibility> eligibility_;

    bool configured_ = false;
};

} // namespace market
} // namespace tradeguard
