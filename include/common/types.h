#pragma once

#include "common/errors.h"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace tradeguard {
namespace common {

/**
 * @file types.h
 * @brief Fundamental types and utilities used throughout the TradeGuard engine
 *
 * This header defines the identifier aliases shared by every market component
 * and the Result<T> wrapper returned by every state-mutating operation.
 */

/// @brief Opaque participant identifier (DID or address); never parsed
using Principal = std::string;

/// @brief Listing identifier chosen by the submitter (must be > 0)
using ListingId = uint64_t;

/// @brief Escrow record identifier assigned by the settlement component
using EscrowId = uint64_t;

/// @brief Dispute identifier assigned by the arbitration component
using DisputeId = uint64_t;

/// @brief Price or escrowed amount in the smallest unit of its currency
using Amount = uint64_t;

/// @brief Logical clock of the state store, used as the timestamp of records
using BlockHeight = uint64_t;

/// @brief Unsigned reputation score of a participant
using ReputationPoints = uint64_t;

/// @brief Raw SHA-256 digest (32 bytes)
using Hash = std::vector<uint8_t>;

/**
 * @brief Type-safe result wrapper for operations that can fail
 *
 * Holds either a success value or a tagged ErrorKind with a human readable
 * message. Operations never throw across the public API; callers inspect the
 * result and surface error_kind() verbatim.
 *
 * @tparam T The type of the success value (must be default constructible)
 *
 * @note Thread safety: This class is not thread-safe. Each instance should be
 *       used by only one thread at a time.
 *
 * Example usage:
 * @code
 * auto result = registry.submit_listing(caller, draft);
 * if (result.is_ok()) {
 *     ListingId id = result.value();
 * } else if (result.error_kind() == ErrorKind::DuplicateHash) {
 *     // Handle resubmission of a known item
 * }
 * @endcode
 */
template <typename T>
class Result {
private:
  bool success_;
  T value_;
  ErrorKind kind_;
  std::string error_;

public:
  /**
   * @brief Construct a successful result with a value
   * @param value The success value to store
   */
  explicit Result(T value)
      : success_(true), value_(std::move(value)), kind_(ErrorKind::None) {}

  /**
   * @brief Construct a failed result from an error kind
   * @param kind The error kind; the message is the kind name
   */
  explicit Result(ErrorKind kind)
      : success_(false), value_(), kind_(kind), error_(to_string(kind)) {}

  /**
   * @brief Construct a failed result with additional detail
   * @param kind The error kind
   * @param detail Context appended to the kind name
   */
  Result(ErrorKind kind, const std::string &detail)
      : success_(false), value_(), kind_(kind),
        error_(std::string(to_string(kind)) + ": " + detail) {}

  /// Copy constructor
  Result(const Result &other)
      : success_(other.success_), value_(other.value_), kind_(other.kind_),
        error_(other.error_) {}

  /// Move constructor
  Result(Result &&other) noexcept
      : success_(other.success_), value_(std::move(other.value_)),
        kind_(other.kind_), error_(std::move(other.error_)) {}

  /// Copy assignment operator
  Result &operator=(const Result &other) {
    if (this != &other) {
      success_ = other.success_;
      value_ = other.value_;
      kind_ = other.kind_;
      error_ = other.error_;
    }
    return *this;
  }

  /// Move assignment operator
  Result &operator=(Result &&other) noexcept {
    if (this != &other) {
      success_ = other.success_;
      value_ = std::move(other.value_);
      kind_ = other.kind_;
      error_ = std::move(other.error_);
    }
    return *this;
  }

  /**
   * @brief Propagate the failure of another result with a different value type
   * @warning Only call this with a result for which is_err() returns true
   */
  template <typename U>
  static Result propagate(const Result<U> &failed) {
    Result r(failed.error_kind());
    r.error_ = failed.error();
    return r;
  }

  /// @return true if the operation succeeded
  bool is_ok() const noexcept { return success_; }

  /// @return true if the operation failed
  bool is_err() const noexcept { return !success_; }

  /**
   * @brief Get the success value (lvalue reference)
   * @warning Only call this if is_ok() returns true
   */
  const T &value() const & { return value_; }

  /**
   * @brief Get the success value (rvalue reference)
   * @warning Only call this if is_ok() returns true
   */
  T &&value() && { return std::move(value_); }

  /// @return ErrorKind::None on success, otherwise the failure kind
  ErrorKind error_kind() const noexcept { return kind_; }

  /// @return The error message (empty on success)
  const std::string &error() const noexcept { return error_; }

  explicit operator bool() const noexcept { return success_; }

  /**
   * @brief Get value or return default on error
   * @param default_value Value to return if result is an error
   */
  T value_or(const T &default_value) const {
    return success_ ? value_ : default_value;
  }
};

} // namespace common
} // namespace tradeguard
