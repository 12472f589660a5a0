#pragma once

#include <string>

namespace aggregator::fhe {

/*
  Opaque encrypted-value handle.

  The core never interprets the bytes; only the configured CiphertextBackend
  does. Empty bytes denote an uninitialized handle, which backends treat as an
  encryption of zero once InitializeIfNeeded() has materialized it.
*/
struct CiphertextHandle {
  std::string bytes;

  bool IsInitialized() const {
    return !bytes.empty();
  }
};

/*
  Homomorphic capability consumed by the aggregation engine.

  Implementations must be deterministic for Fingerprint(): the same handle
  bytes always produce the same fingerprint.
*/
class CiphertextBackend {
 public:
  virtual ~CiphertextBackend() = default;

  virtual CiphertextHandle Zero() = 0;

  virtual CiphertextHandle Add(const CiphertextHandle& lhs, const CiphertextHandle& rhs) = 0;

  // Idempotent. Required before Add() or Fingerprint().
  virtual void InitializeIfNeeded(CiphertextHandle& handle) = 0;

  virtual std::string Fingerprint(const CiphertextHandle& handle) const = 0;

  // Structural check applied to submissions. Uninitialized handles are well formed.
  virtual bool IsWellFormed(const CiphertextHandle& handle) const = 0;
};

} // namespace aggregator::fhe
