#pragma once

#include <string>

#include "decryption_oracle.hpp"

namespace aggregator::oracle {

/*
  HMAC-SHA-256 attestation over (request_id, cleartext).

  The message is a domain label, the big-endian request id, then the
  length-prefixed cleartext. Signer and verifier share the key; a forged
  callback without it cannot produce a valid tag.
*/
class HmacAttestor {
 public:
  explicit HmacAttestor(std::string key);

  std::string Sign(RequestId request_id, const std::string& cleartext) const;

 private:
  std::string key_;
};

class HmacAttestationVerifier final : public AttestationVerifier {
 public:
  explicit HmacAttestationVerifier(std::string key);

  bool Verify(RequestId request_id, const std::string& cleartext, const std::string& attestation) const override;

 private:
  HmacAttestor attestor_;
};

} // namespace aggregator::oracle
