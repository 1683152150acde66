#include "market/types.h"
#include <limits>

namespace tradeguard {
namespace market {

BlockHeight BlockClock::advance(uint64_t blocks) {
    if (height_ > std::numeric_limits<BlockHeight>::max() - blocks) {
        height_ = std::numeric_limits<BlockHeight>::max();
    } else {
        height_ += blocks;
    }
    return height_;
}

const char* to_string(Currency currency) {
    switch (currency) {
        case Currency::STX: return "STX";
        case Currency::USD: return "USD";
        case Currency::BTC: return "BTC";
        default: return "unknown";
    }
}

std::optional<Currency> parse_currency(const std::string& text) {
    if (text == "STX") return Currency::STX;
    if (text == "USD") return Currency::USD;
    if (text == "BTC") return Currency::BTC;
    return std::nullopt;
}

const char* to_string(ListingStatus status) {
    switch (status) {
        case ListingStatus::Active: return "active";
        case ListingStatus::Paused: return "paused";
        case ListingStatus::Closed: return "closed";
        default: return "unknown";
    }
}

const char* to_string(EscrowState state) {
    switch (state) {
        case EscrowState::Held: return "held";
        case EscrowState::Released: return "released";
        case EscrowState::Refunded: return "refunded";
        default: return "unknown";
    }
}

std::optional<EscrowState> parse_escrow_state(const std::string& text) {
    if (text == "held") return EscrowState::Held;
    if (text == "released") return EscrowState::Released;
    if (text == "refunded") return EscrowState::Refunded;
    return std::nullopt;
}

const char* to_string(DisputeState state) {
    switch (state) {
        case DisputeState::Open: return "open";
        case DisputeState::Ruled: return "ruled";
        default: return "unknown";
    }
}

std::optional<DisputeState> parse_dispute_state(const std::string& text) {
    if (text == "open") return DisputeState::Open;
    if (text == "ruled") return DisputeState::Ruled;
    return std::nullopt;
}

const char* to_string(Ruling ruling) {
    switch (ruling) {
        case Ruling::Release: return "release";
        case Ruling::Refund: return "refund";
        default: return "unknown";
    }
}

std::optional<Ruling> parse_ruling(const std::string& text) {
    if (text == "release") return Ruling::Release;
    if (text == "refund") return Ruling::Refund;
    return std::nullopt;
}

const char* to_string(ReputationOutcome outcome) {
    switch (outcome) {
        case ReputationOutcome::Fulfilled: return "fulfilled";
        case ReputationOutcome::FraudSuspected: return "fraud_suspected";
        default: return "unknown";
    }
}

} // namespace market
} // namespace tradeguard
