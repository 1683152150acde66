#include "common/errors.h"

#include <array>

namespace tradeguard {
namespace common {

namespace {

constexpr std::array<ErrorKind, 28> kAllKinds = {
    ErrorKind::None,
    ErrorKind::Unauthorized,
    ErrorKind::AlreadySet,
    ErrorKind::InvalidPrincipal,
    ErrorKind::InvalidListingId,
    ErrorKind::InvalidItemHash,
    ErrorKind::InvalidSellerDid,
    ErrorKind::InsufficientReputation,
    ErrorKind::InvalidPrice,
    ErrorKind::InvalidCategory,
    ErrorKind::InvalidLocation,
    ErrorKind::InvalidCurrency,
    ErrorKind::DuplicateHash,
    ErrorKind::BlacklistedSeller,
    ErrorKind::AnomalyDetected,
    ErrorKind::InvalidRiskScore,
    ErrorKind::DuplicateListingId,
    ErrorKind::InvalidEvidenceRef,
    ErrorKind::ListingNotFound,
    ErrorKind::InvalidState,
    ErrorKind::DuplicateDispute,
    ErrorKind::AlreadyRuled,
    ErrorKind::DisputeNotFound,
    ErrorKind::EscrowMismatch,
    ErrorKind::NoOpenEscrow,
    ErrorKind::SnapshotInvalid,
    ErrorKind::ConfigInvalid,
    ErrorKind::IoError};

} // namespace

const char *to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "None";
  case ErrorKind::Unauthorized:
    return "Unauthorized";
  case ErrorKind::AlreadySet:
    return "AlreadySet";
  case ErrorKind::InvalidPrincipal:
    return "InvalidPrincipal";
  case ErrorKind::InvalidListingId:
    return "InvalidListingId";
  case ErrorKind::InvalidItemHash:
    return "InvalidItemHash";
  case ErrorKind::InvalidSellerDid:
    return "InvalidSellerDid";
  case ErrorKind::InsufficientReputation:
    return "InsufficientReputation";
  case ErrorKind::InvalidPrice:
    return "InvalidPrice";
  case ErrorKind::InvalidCategory:
    return "InvalidCategory";
  case ErrorKind::InvalidLocation:
    return "InvalidLocation";
  case ErrorKind::InvalidCurrency:
    return "InvalidCurrency";
  case ErrorKind::DuplicateHash:
    return "DuplicateHash";
  case ErrorKind::BlacklistedSeller:
    return "BlacklistedSeller";
  case ErrorKind::AnomalyDetected:
    return "AnomalyDetected";
  case ErrorKind::InvalidRiskScore:
    return "InvalidRiskScore";
  case ErrorKind::DuplicateListingId:
    return "DuplicateListingId";
  case ErrorKind::InvalidEvidenceRef:
    return "InvalidEvidenceRef";
  case ErrorKind::ListingNotFound:
    return "ListingNotFound";
  case ErrorKind::InvalidState:
    return "InvalidState";
  case ErrorKind::DuplicateDispute:
    return "DuplicateDispute";
  case ErrorKind::AlreadyRuled:
    return "AlreadyRuled";
  case ErrorKind::DisputeNotFound:
    return "DisputeNotFound";
  case ErrorKind::EscrowMismatch:
    return "EscrowMismatch";
  case ErrorKind::NoOpenEscrow:
    return "NoOpenEscrow";
  case ErrorKind::SnapshotInvalid:
    return "SnapshotInvalid";
  case ErrorKind::ConfigInvalid:
    return "ConfigInvalid";
  case ErrorKind::IoError:
    return "IoError";
  default:
    return "Unknown";
  }
}

const char *to_string(ErrorCategory category) {
  switch (category) {
  case ErrorCategory::None:
    return "none";
  case ErrorCategory::Authorization:
    return "authorization";
  case ErrorCategory::Validation:
    return "validation";
  case ErrorCategory::StateConflict:
    return "state-conflict";
  case ErrorCategory::Settlement:
    return "settlement";
  case ErrorCategory::Storage:
    return "storage";
  default:
    return "unknown";
  }
}

ErrorCategory category_of(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return ErrorCategory::None;
  case ErrorKind::Unauthorized:
  case ErrorKind::AlreadySet:
  case ErrorKind::InvalidPrincipal:
    return ErrorCategory::Authorization;
  case ErrorKind::ListingNotFound:
  case ErrorKind::InvalidState:
  case ErrorKind::DuplicateDispute:
  case ErrorKind::AlreadyRuled:
  case ErrorKind::DisputeNotFound:
    return ErrorCategory::StateConflict;
  case ErrorKind::EscrowMismatch:
  case ErrorKind::NoOpenEscrow:
    return ErrorCategory::Settlement;
  case ErrorKind::SnapshotInvalid:
  case ErrorKind::ConfigInvalid:
  case ErrorKind::IoError:
    return ErrorCategory::Storage;
  default:
    return ErrorCategory::Validation;
  }
}

uint32_t error_code(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return 0;
  case ErrorKind::Unauthorized:
    return 100;
  case ErrorKind::InvalidListingId:
    return 101;
  case ErrorKind::InvalidItemHash:
    return 102;
  case ErrorKind::InvalidSellerDid:
    return 103;
  case ErrorKind::InsufficientReputation:
    return 104;
  case ErrorKind::DuplicateHash:
    return 105;
  case ErrorKind::DuplicateListingId:
    return 106;
  case ErrorKind::BlacklistedSeller:
    return 107;
  case ErrorKind::AnomalyDetected:
    return 108;
  case ErrorKind::InvalidPrice:
    return 109;
  case ErrorKind::InvalidCategory:
    return 110;
  case ErrorKind::AlreadySet:
    return 111;
  case ErrorKind::InvalidPrincipal:
    return 112;
  case ErrorKind::InvalidRiskScore:
    return 113;
  case ErrorKind::InvalidEvidenceRef:
    return 114;
  case ErrorKind::InvalidLocation:
    return 115;
  case ErrorKind::InvalidCurrency:
    return 116;
  case ErrorKind::InvalidState:
    return 117;
  case ErrorKind::ListingNotFound:
    return 118;
  case ErrorKind::DuplicateDispute:
    return 120;
  case ErrorKind::AlreadyRuled:
    return 121;
  case ErrorKind::DisputeNotFound:
    return 122;
  case ErrorKind::EscrowMismatch:
    return 130;
  case ErrorKind::NoOpenEscrow:
    return 131;
  case ErrorKind::SnapshotInvalid:
    return 140;
  case ErrorKind::IoError:
    return 141;
  case ErrorKind::ConfigInvalid:
    return 142;
  default:
    return 199;
  }
}

std::optional<ErrorKind> parse_error_kind(const std::string &name) {
  for (ErrorKind kind : kAllKinds) {
    if (name == to_string(kind)) {
      return kind;
    }
  }
  return std::nullopt;
}

} // namespace common
} // namespace tradeguard
