#include "common/hashing.h"
#include <iomanip>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <sstream>

namespace tradeguard {
namespace common {
namespace hashing {

Hash sha256(const std::vector<uint8_t> &data) {
  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    return {};
  }

  Hash hash(SHA256_DIGEST_LENGTH);
  unsigned int len = SHA256_DIGEST_LENGTH;
  if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1 ||
      EVP_DigestUpdate(ctx, data.data(), data.size()) != 1 ||
      EVP_DigestFinal_ex(ctx, hash.data(), &len) != 1) {
    EVP_MD_CTX_free(ctx);
    return {};
  }

  EVP_MD_CTX_free(ctx);
  return hash;
}

Hash sha256_multi(const std::vector<std::string> &chunks) {
  EVP_MD_CTX *ctx = EVP_MD_CTX_new();
  if (!ctx) {
    return {};
  }

  if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(ctx);
    return {};
  }

  for (const auto &chunk : chunks) {
    if (!chunk.empty()) {
      if (EVP_DigestUpdate(ctx, chunk.data(), chunk.size()) != 1) {
        EVP_MD_CTX_free(ctx);
        return {};
      }
    }
  }

  Hash hash(SHA256_DIGEST_LENGTH);
  unsigned int len = SHA256_DIGEST_LENGTH;
  if (EVP_DigestFinal_ex(ctx, hash.data(), &len) != 1) {
    EVP_MD_CTX_free(ctx);
    return {};
  }

  EVP_MD_CTX_free(ctx);
  return hash;
}

std::string to_hex(const Hash &digest) {
  std::ostringstream oss;
  for (uint8_t byte : digest) {
    oss << std::hex << std::setfill('0') << std::setw(2)
        << static_cast<int>(byte);
  }
  return oss.str();
}

std::string sha256_hex(const std::string &data) {
  Hash digest = sha256(std::vector<uint8_t>(data.begin(), data.end()));
  return to_hex(digest);
}

std::string item_digest(const std::string &seller,
                        const std::string &description) {
  return to_hex(sha256_multi({std::to_string(seller.size()), ":", seller,
                              std::to_string(description.size()), ":",
                              description}));
}

std::string content_ref(const std::string &payload) {
  return sha256_hex(payload);
}

} // namespace hashing
} // namespace common
} // namespace tradeguard
