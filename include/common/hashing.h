#pragma once

#include "common/types.h"

#include <string>
#include <vector>

namespace tradeguard {
namespace common {
namespace hashing {

/// Length of a hex-encoded SHA-256 digest, which is also the item hash length
constexpr size_t HEX_DIGEST_LENGTH = 64;

/**
 * SHA-256 over raw bytes via OpenSSL EVP.
 * Returns an empty Hash if the digest context could not be set up.
 */
Hash sha256(const std::vector<uint8_t> &data);

/**
 * SHA-256 over several chunks, equivalent to hashing their concatenation.
 */
Hash sha256_multi(const std::vector<std::string> &chunks);

/// Lowercase hex encoding
std::string to_hex(const Hash &digest);

/// Hex SHA-256 of a string, or an empty string on digest failure
std::string sha256_hex(const std::string &data);

/**
 * Derive a 64-character item hash for a physical item.
 * The seller and the item description are length-prefixed so that
 * ("ab", "c") and ("a", "bc") digest differently.
 */
std::string item_digest(const std::string &seller,
                        const std::string &description);

/// Content-address reference for an off-chain evidence payload
std::string content_ref(const std::string &payload);

} // namespace hashing
} // namespace common
} // namespace tradeguard
