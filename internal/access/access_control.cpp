#include "access_control.hpp"

#include <mutex>

namespace aggregator::access {

StaticAccessControl::StaticAccessControl(AccessPolicy policy) : policy_(std::move(policy)) {
}

bool StaticAccessControl::IsAdmin(const std::string& identity) const {
  std::shared_lock lock(mutex_);
  return !policy_.owner.empty() && identity == policy_.owner;
}

bool StaticAccessControl::IsProvider(const std::string& identity) const {
  std::shared_lock lock(mutex_);
  return policy_.providers.contains(identity);
}

bool StaticAccessControl::IsPaused() const {
  std::shared_lock lock(mutex_);
  return policy_.paused;
}

util::Duration StaticAccessControl::SubmissionCooldown() const {
  std::shared_lock lock(mutex_);
  return policy_.submission_cooldown;
}

util::Duration StaticAccessControl::DecryptionRequestCooldown() const {
  std::shared_lock lock(mutex_);
  return policy_.decryption_request_cooldown;
}

void StaticAccessControl::SetPaused(bool paused) {
  std::unique_lock lock(mutex_);
  policy_.paused = paused;
}

} // namespace aggregator::access
