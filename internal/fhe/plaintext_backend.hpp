#pragma once

#include <cstdint>
#include <optional>

#include "ciphertext.hpp"
#include "internal/oracle/decryption_oracle.hpp"

namespace aggregator::fhe {

/*
  Development ciphertext backend.

  NOT an encryption scheme. Each handle is a tagged envelope carrying the
  value in the clear plus a random nonce, so equal readings still produce
  distinct fingerprints. Addition wraps modulo 2^64 like an euint64.

  Envelope layout (20 bytes):
    [0..4)   magic "PT01"
    [4..12)  value, big-endian
    [12..20) nonce
*/
class PlaintextCiphertextBackend final : public CiphertextBackend, public oracle::Decryptor {
 public:
  static constexpr std::size_t kEnvelopeSize = 20;

  CiphertextHandle Encrypt(uint64_t value) const;

  CiphertextHandle Zero() override;
  CiphertextHandle Add(const CiphertextHandle& lhs, const CiphertextHandle& rhs) override;
  void             InitializeIfNeeded(CiphertextHandle& handle) override;
  std::string      Fingerprint(const CiphertextHandle& handle) const override;
  bool             IsWellFormed(const CiphertextHandle& handle) const override;

  uint64_t Decrypt(const CiphertextHandle& handle) const override;

 private:
  static std::optional<uint64_t> Open(const CiphertextHandle& handle);
  static CiphertextHandle        Seal(uint64_t value, const std::string& nonce);
};

} // namespace aggregator::fhe
