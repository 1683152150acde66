#pragma once

#include "common/types.h"

#include <optional>
#include <string>
#include <vector>

namespace tradeguard {
namespace market {

using namespace tradeguard::common;

// ============================================================================
// Limits
// ============================================================================

constexpr size_t ITEM_HASH_LENGTH = 64;
constexpr size_t MAX_CATEGORY_LENGTH = 50;
constexpr size_t MAX_LOCATION_LENGTH = 100;
constexpr size_t MAX_EVIDENCE_REF_LENGTH = 128;

/// Category that carries the fixed high-risk surcharge in fraud scoring
constexpr const char* HIGH_RISK_CATEGORY = "high-risk";

/**
 * Logical clock of the state store. Only the host advances it; components
 * read it to timestamp flags, escrows and disputes.
 */
class BlockClock {
public:
    BlockHeight height() const { return height_; }

    /// Saturates at UINT64_MAX
    BlockHeight advance(uint64_t blocks);

    void restore(BlockHeight height) { height_ = height; }

private:
    BlockHeight height_ = 0;
};

// ============================================================================
// Listing Types
// ============================================================================

enum class Currency : uint8_t {
    STX = 0,
    USD = 1,
    BTC = 2
};

const char* to_string(Currency currency);

/**
 * Parse "STX", "USD" or "BTC" (exact, case-sensitive)
 */
std::optional<Currency> parse_currency(const std::string& text);

/**
 * Externally observed listing status
 */
enum class ListingStatus : uint8_t {
    Active = 0,
    Paused = 1,
    Closed = 2
};

const char* to_string(ListingStatus status);

/**
 * Authority-initiated suspension record.
 * Exists iff the listing is currently flagged.
 */
struct FlaggedListing {
    ListingId listing_id;
    std::string reason;
    BlockHeight timestamp;
    uint64_t risk_score;

    FlaggedListing() : listing_id(0), timestamp(0), risk_score(0) {}
};

/**
 * Admitted listing.
 *
 * status() is derived from three orthogonal pieces of state so that an
 * authority flag and a seller pause cannot overwrite each other.
 */
struct Listing {
    ListingId id;
    std::string item_hash;
    Principal seller;
    Amount price;
    std::string category;
    std::string location;
    Currency currency;
    std::optional<uint64_t> risk_score;
    BlockHeight created_at;

    std::optional<FlaggedListing> flag;
    bool paused_by_seller;
    bool closed;

    Listing()
        : id(0), price(0), currency(Currency::STX), created_at(0),
          paused_by_seller(false), closed(false) {}

    ListingStatus status() const {
        if (closed) {
            return ListingStatus::Closed;
        }
        if (flag.has_value() || paused_by_seller) {
            return ListingStatus::Paused;
        }
        return ListingStatus::Active;
    }

    bool is_flagged() const { return flag.has_value(); }
};

/**
 * Submission payload for ListingRegistry::submit_listing.
 * currency stays textual so the registry can reject unknown codes in order.
 */
struct ListingDraft {
    ListingId id = 0;
    std::string item_hash;
    Principal seller;
    std::optional<ReputationPoints> seller_reputation;  // read from the ledger when absent
    Amount price = 0;
    std::string category;
    std::string location;
    std::string currency;
};

// ============================================================================
// Escrow Types
// ============================================================================

enum class EscrowState : uint8_t {
    Held = 0,
    Released = 1,
    Refunded = 2
};

const char* to_string(EscrowState state);
std::optional<EscrowState> parse_escrow_state(const std::string& text);

struct EscrowRecord {
    EscrowId escrow_id;
    ListingId listing_id;
    Principal buyer;
    Principal seller;
    Amount amount;
    Currency currency;
    EscrowState state;
    BlockHeight opened_at;
    BlockHeight settled_at;

    EscrowRecord()
        : escrow_id(0), listing_id(0), amount(0), currency(Currency::STX),
          state(EscrowState::Held), opened_at(0), settled_at(0) {}

    bool is_held() const { return state == EscrowState::Held; }
    bool is_party(const Principal& who) const { return who == buyer || who == seller; }
};

// ============================================================================
// Dispute Types
// ============================================================================

enum class DisputeState : uint8_t {
    Open = 0,
    Ruled = 1
};

enum class Ruling : uint8_t {
    Release = 0,   // pay the seller
    Refund = 1     // return funds to the buyer
};

const char* to_string(DisputeState state);
std::optional<DisputeState> parse_dispute_state(const std::string& text);
const char* to_string(Ruling ruling);
std::optional<Ruling> parse_ruling(const std::string& text);

struct Dispute {
    DisputeId dispute_id;
    ListingId listing_id;
    EscrowId escrow_id;
    Principal opened_by;
    std::vector<std::string> evidence_refs;
    DisputeState state;
    std::optional<Ruling> ruling;
    Principal arbitrator;
    BlockHeight opened_at;
    BlockHeight ruled_at;

    Dispute()
        : dispute_id(0), listing_id(0), escrow_id(0),
          state(DisputeState::Open), opened_at(0), ruled_at(0) {}
};

// ============================================================================
// Reputation Types
// ============================================================================

/**
 * Settlement outcome applied to participant reputation
 */
enum class ReputationOutcome : uint8_t {
    Fulfilled = 0,
    FraudSuspected = 1
};

const char* to_string(ReputationOutcome outcome);

} // namespace market
} // namespace tradeguard
