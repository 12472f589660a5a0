#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

#include <openssl/evp.h>

namespace aggregator::crypto {

/*
  Thin wrappers over OpenSSL EVP.

  Digests are returned as raw bytes in std::string so they can flow straight
  into protobuf bytes fields and repository records.
*/

constexpr std::size_t kSha256Size = 32;

std::string Sha256(std::string_view data);

std::string HmacSha256(std::string_view key, std::string_view data);

// Constant-time comparison; false when sizes differ.
bool ConstantTimeEquals(std::string_view lhs, std::string_view rhs);

// Cryptographically secure random bytes (RAND_bytes).
std::string RandomBytes(std::size_t size);

// Incremental SHA-256 over several fields.
class Sha256Builder {
 public:
  Sha256Builder();

  Sha256Builder& Update(std::string_view data);
  Sha256Builder& UpdateU64(uint64_t value);  // big-endian
  // Length-prefixes the field so adjacent fields cannot be re-split.
  Sha256Builder& UpdateField(std::string_view data);

  std::string Finish();

 private:
  struct CtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const {
      EVP_MD_CTX_free(ctx);
    }
  };

  std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx_;
  bool                                    finished_ = false;
};

} // namespace aggregator::crypto
