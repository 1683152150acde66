#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace tradeguard {
namespace common {

/**
 * @brief Every failure an engine operation can report
 *
 * Kinds are stable identifiers surfaced verbatim to callers. They are grouped
 * into categories by category_of().
 */
enum class ErrorKind {
  None,

  // Authorization
  Unauthorized,
  AlreadySet,
  InvalidPrincipal,

  // Validation
  InvalidListingId,
  InvalidItemHash,
  InvalidSellerDid,
  InsufficientReputation,
  InvalidPrice,
  InvalidCategory,
  InvalidLocation,
  InvalidCurrency,
  DuplicateHash,
  BlacklistedSeller,
  AnomalyDetected,
  InvalidRiskScore,
  DuplicateListingId,
  InvalidEvidenceRef,

  // State conflict
  ListingNotFound,
  InvalidState,
  DuplicateDispute,
  AlreadyRuled,
  DisputeNotFound,

  // Settlement
  EscrowMismatch,
  NoOpenEscrow,

  // Storage (snapshot and configuration IO)
  SnapshotInvalid,
  ConfigInvalid,
  IoError
};

enum class ErrorCategory {
  None,
  Authorization,
  Validation,
  StateConflict,
  Settlement,
  Storage
};

/// @return The stable kind name, e.g. "DuplicateHash"
const char *to_string(ErrorKind kind);

const char *to_string(ErrorCategory category);

ErrorCategory category_of(ErrorKind kind);

/**
 * @brief Numeric code compatible with the marketplace contract error space
 * @return 0 for ErrorKind::None, otherwise a code in the 100..199 range
 */
uint32_t error_code(ErrorKind kind);

/// @return The kind whose name matches, or nullopt
std::optional<ErrorKind> parse_error_kind(const std::string &name);

} // namespace common
} // namespace tradeguard
