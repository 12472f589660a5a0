#pragma once

#include <set>
#include <shared_mutex>
#include <string>

#include "internal/util/time.hpp"

namespace aggregator::access {

/*
  Administrative surface as seen by the core.

  Ownership transfer, provider enrollment and cooldown tuning live outside
  this service; the core only reads their effect through this interface.
*/
class AccessControl {
 public:
  virtual ~AccessControl() = default;

  virtual bool IsAdmin(const std::string& identity) const    = 0;
  virtual bool IsProvider(const std::string& identity) const = 0;
  virtual bool IsPaused() const                               = 0;

  virtual util::Duration SubmissionCooldown() const        = 0;
  virtual util::Duration DecryptionRequestCooldown() const = 0;
};

struct AccessPolicy {
  std::string           owner;
  std::set<std::string> providers;
  bool                  paused = false;

  util::Duration submission_cooldown{0};
  util::Duration decryption_request_cooldown{0};
};

// Policy seeded from configuration. Provider enrollment is fixed for the
// process lifetime; only the pause switch can be flipped at runtime.
class StaticAccessControl final : public AccessControl {
 public:
  explicit StaticAccessControl(AccessPolicy policy);

  bool IsAdmin(const std::string& identity) const override;
  bool IsProvider(const std::string& identity) const override;
  bool IsPaused() const override;

  util::Duration SubmissionCooldown() const override;
  util::Duration DecryptionRequestCooldown() const override;

  void SetPaused(bool paused);

 private:
  mutable std::shared_mutex mutex_;
  AccessPolicy              policy_;
};

} // namespace aggregator::access
