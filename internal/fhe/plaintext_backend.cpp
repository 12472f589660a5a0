#include "plaintext_backend.hpp"

#include <stdexcept>

#include "internal/crypto/digest.hpp"

namespace aggregator::fhe {

namespace {

constexpr char        kMagic[]   = {'P', 'T', '0', '1'};
constexpr std::size_t kMagicSize = sizeof(kMagic);
constexpr std::size_t kNonceSize = 8;

} // namespace

CiphertextHandle PlaintextCiphertextBackend::Seal(uint64_t value, const std::string& nonce) {
  CiphertextHandle handle;
  handle.bytes.reserve(kEnvelopeSize);
  handle.bytes.append(kMagic, kMagicSize);
  for (int shift = 56; shift >= 0; shift -= 8) {
    handle.bytes.push_back(static_cast<char>((value >> shift) & 0xFF));
  }
  handle.bytes.append(nonce);
  return handle;
}

std::optional<uint64_t> PlaintextCiphertextBackend::Open(const CiphertextHandle& handle) {
  if (handle.bytes.size() != kEnvelopeSize || handle.bytes.compare(0, kMagicSize, kMagic, kMagicSize) != 0) {
    return std::nullopt;
  }

  uint64_t value = 0;
  for (std::size_t i = kMagicSize; i < kMagicSize + 8; ++i) {
    value = (value << 8) | static_cast<unsigned char>(handle.bytes[i]);
  }
  return value;
}

CiphertextHandle PlaintextCiphertextBackend::Encrypt(uint64_t value) const {
  return Seal(value, crypto::RandomBytes(kNonceSize));
}

CiphertextHandle PlaintextCiphertextBackend::Zero() {
  return Seal(0, std::string(kNonceSize, '\0'));
}

CiphertextHandle PlaintextCiphertextBackend::Add(const CiphertextHandle& lhs, const CiphertextHandle& rhs) {
  const auto a = Open(lhs);
  const auto b = Open(rhs);
  if (!a || !b) {
    throw std::invalid_argument("plaintext backend: cannot add malformed or uninitialized handle");
  }
  // Sums carry a zero nonce so the accumulator is reproducible for a fixed input order.
  return Seal(*a + *b, std::string(kNonceSize, '\0'));
}

void PlaintextCiphertextBackend::InitializeIfNeeded(CiphertextHandle& handle) {
  if (!handle.IsInitialized()) {
    handle = Zero();
  }
}

std::string PlaintextCiphertextBackend::Fingerprint(const CiphertextHandle& handle) const {
  if (!handle.IsInitialized()) {
    throw std::invalid_argument("plaintext backend: fingerprint of uninitialized handle");
  }
  return crypto::Sha256(handle.bytes);
}

bool PlaintextCiphertextBackend::IsWellFormed(const CiphertextHandle& handle) const {
  return !handle.IsInitialized() || Open(handle).has_value();
}

uint64_t PlaintextCiphertextBackend::Decrypt(const CiphertextHandle& handle) const {
  const auto value = Open(handle);
  if (!value) {
    throw std::invalid_argument("plaintext backend: cannot decrypt malformed handle");
  }
  return *value;
}

} // namespace aggregator::fhe
