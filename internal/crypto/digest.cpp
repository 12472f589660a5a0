#include "digest.hpp"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <limits>
#include <stdexcept>

namespace aggregator::crypto {

namespace {

[[noreturn]] void ThrowOpenSsl(const char* what) {
  const unsigned long code = ERR_get_error();
  char                buf[256];
  ERR_error_string_n(code, buf, sizeof(buf));
  throw std::runtime_error(std::string(what) + ": " + buf);
}

} // namespace

Sha256Builder::Sha256Builder() : ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) ThrowOpenSsl("sha256: EVP_MD_CTX_new");
  if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) ThrowOpenSsl("sha256: EVP_DigestInit_ex");
}

Sha256Builder& Sha256Builder::Update(std::string_view data) {
  if (finished_) throw std::logic_error("sha256: update after finish");
  if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) ThrowOpenSsl("sha256: EVP_DigestUpdate");
  return *this;
}

Sha256Builder& Sha256Builder::UpdateU64(uint64_t value) {
  char be[8];
  for (int i = 7; i >= 0; --i) {
    be[i] = static_cast<char>(value & 0xFF);
    value >>= 8;
  }
  return Update(std::string_view(be, sizeof(be)));
}

Sha256Builder& Sha256Builder::UpdateField(std::string_view data) {
  UpdateU64(static_cast<uint64_t>(data.size()));
  return Update(data);
}

std::string Sha256Builder::Finish() {
  if (finished_) throw std::logic_error("sha256: finish called twice");

  std::string  out(EVP_MAX_MD_SIZE, '\0');
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), reinterpret_cast<unsigned char*>(out.data()), &len) != 1) ThrowOpenSsl("sha256: EVP_DigestFinal_ex");
  finished_ = true;
  out.resize(len);
  return out;
}

std::string Sha256(std::string_view data) {
  return Sha256Builder().Update(data).Finish();
}

std::string HmacSha256(std::string_view key, std::string_view data) {
  if (key.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    throw std::invalid_argument("hmac: key too large");
  }

  std::string  out(EVP_MAX_MD_SIZE, '\0');
  unsigned int len = 0;
  const auto*  ok  = HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), reinterpret_cast<const unsigned char*>(data.data()),
                          data.size(), reinterpret_cast<unsigned char*>(out.data()), &len);
  if (ok == nullptr) ThrowOpenSsl("hmac: HMAC");
  out.resize(len);
  return out;
}

bool ConstantTimeEquals(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

std::string RandomBytes(std::size_t size) {
  if (size > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
    throw std::invalid_argument("random: size too large");
  }

  std::string out(size, '\0');
  if (size > 0 && RAND_bytes(reinterpret_cast<unsigned char*>(out.data()), static_cast<int>(size)) != 1) {
    ThrowOpenSsl("random: RAND_bytes");
  }
  return out;
}

} // namespace aggregator::crypto
