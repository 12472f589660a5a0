#pragma once

#include <cstdint>
#include <string>

namespace aggregator::db::model {

// Append-only; (batch_id, index) is never reassigned.
struct CiphertextRecord {
  uint64_t    batch_id = 0;
  uint64_t    index    = 0;
  std::string handle;      // opaque ciphertext bytes as submitted
  std::string submitter;
  std::string fingerprint; // raw SHA-256
  uint64_t    submitted_at_ms = 0;
};

} // namespace aggregator::db::model
