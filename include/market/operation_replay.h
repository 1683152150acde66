#pragma once

#include "market/trust_engine.h"

#include <ostream>
#include <string>
#include <nlohmann/json.hpp>

namespace tradeguard {
namespace market {

/**
 * Summary of one replay run
 */
struct ReplaySummary {
    size_t applied = 0;
    size_t rejected = 0;
    size_t malformed = 0;
};

/**
 * Apply one JSON-encoded operation, e.g.
 * {"op": "open_escrow", "caller": "ST2", "listing_id": 1, "amount": 1000, "currency": "STX"}
 *
 * @return The operation result rendered as text ("1", "true", "released")
 *         or the error kind of a rejected operation
 * @throws nlohmann::json::exception when a required field is missing or has
 *         the wrong type
 * @throws std::invalid_argument for an unknown op or ruling, and for a
 *         numeric field that is negative or fractional
 */
Result<std::string> apply_operation(TrustEngine& engine, const nlohmann::json& operation);

/**
 * Apply a JSON array of operations in order, writing one line per operation:
 * "<index> <op> ok <value>" or "<index> <op> <ErrorKind>".
 */
ReplaySummary replay_operations(TrustEngine& engine, const nlohmann::json& operations,
                                std::ostream& out);

} // namespace market
} // namespace tradeguard
