#include "hmac_attestation.hpp"

#include <stdexcept>

#include "internal/crypto/digest.hpp"

namespace aggregator::oracle {

namespace {

constexpr char kAttestationDomain[] = "batch-aggregator/attestation/v1";

std::string AttestedMessage(RequestId request_id, const std::string& cleartext) {
  std::string message(kAttestationDomain);
  for (int shift = 56; shift >= 0; shift -= 8) {
    message.push_back(static_cast<char>((request_id >> shift) & 0xFF));
  }
  const uint64_t size = cleartext.size();
  for (int shift = 56; shift >= 0; shift -= 8) {
    message.push_back(static_cast<char>((size >> shift) & 0xFF));
  }
  message += cleartext;
  return message;
}

} // namespace

HmacAttestor::HmacAttestor(std::string key) : key_(std::move(key)) {
  if (key_.empty()) {
    throw std::invalid_argument("attestation key must not be empty");
  }
}

std::string HmacAttestor::Sign(RequestId request_id, const std::string& cleartext) const {
  return crypto::HmacSha256(key_, AttestedMessage(request_id, cleartext));
}

HmacAttestationVerifier::HmacAttestationVerifier(std::string key) : attestor_(std::move(key)) {
}

bool HmacAttestationVerifier::Verify(RequestId request_id, const std::string& cleartext, const std::string& attestation) const {
  return crypto::ConstantTimeEquals(attestor_.Sign(request_id, cleartext), attestation);
}

} // namespace aggregator::oracle
