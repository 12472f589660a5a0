#pragma once

#include <cstdint>
#include <string>

namespace aggregator::db::model {

// Two independent rate-limit namespaces; an identity may appear in both.
enum class CooldownScope : int {
  kSubmission        = 1,
  kDecryptionRequest = 2,
};

struct CooldownRecord {
  CooldownScope scope = CooldownScope::kSubmission;
  std::string   identity;
  uint64_t      last_action_ms = 0;
};

} // namespace aggregator::db::model
