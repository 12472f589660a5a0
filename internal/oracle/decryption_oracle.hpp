#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "internal/fhe/ciphertext.hpp"

namespace aggregator::oracle {

using RequestId = uint64_t;

/*
  Resume entry point handed to the oracle with every request.

  The oracle calls it later, out of band, with the decrypted aggregate and an
  attestation binding that cleartext to the request. Delivery is expected
  exactly once but callers must tolerate duplicates.
*/
using ResumeFn = std::function<void(RequestId request_id, const std::string& cleartext, const std::string& attestation)>;

/*
  Asynchronous decryption capability.

  RequestDecryption() must not call resume synchronously: the caller is still
  inside its own serialized operation when this returns.
*/
class DecryptionOracle {
 public:
  virtual ~DecryptionOracle() = default;

  virtual RequestId RequestDecryption(const fhe::CiphertextHandle& handle, ResumeFn resume) = 0;
};

class AttestationVerifier {
 public:
  virtual ~AttestationVerifier() = default;

  virtual bool Verify(RequestId request_id, const std::string& cleartext, const std::string& attestation) const = 0;
};

// Key-holding side of the oracle; only the oracle process has one.
class Decryptor {
 public:
  virtual ~Decryptor() = default;

  virtual uint64_t Decrypt(const fhe::CiphertextHandle& handle) const = 0;
};

} // namespace aggregator::oracle
