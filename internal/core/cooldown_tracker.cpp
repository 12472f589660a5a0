#include "cooldown_tracker.hpp"

#include "internal/util/errors.hpp"

namespace aggregator::core {

namespace {

const char* ScopeName(db::model::CooldownScope scope) {
  return scope == db::model::CooldownScope::kSubmission ? "submission" : "decryption request";
}

} // namespace

CooldownTracker::CooldownTracker(std::shared_ptr<db::Repository> repository, util::NowFn now) : repository_(std::move(repository)), now_(std::move(now)) {
}

void CooldownTracker::Check(db::Transaction& tx, db::model::CooldownScope scope, const std::string& identity, util::Duration interval) const {
  if (interval.count() <= 0) return;

  const auto last = repository_->GetCooldown(tx, scope, identity);
  if (!last) return;

  const uint64_t now_ms     = util::ToUnixMillis(now_());
  const uint64_t allowed_at = last->last_action_ms + static_cast<uint64_t>(interval.count());
  if (now_ms < allowed_at) {
    throw util::CooldownActive(std::string(ScopeName(scope)) + " cooldown active for '" + identity + "': retry in " + std::to_string(allowed_at - now_ms) +
                               "ms");
  }
}

void CooldownTracker::Touch(db::Transaction& tx, db::model::CooldownScope scope, const std::string& identity) {
  db::model::CooldownRecord record;
  record.scope          = scope;
  record.identity       = identity;
  record.last_action_ms = util::ToUnixMillis(now_());
  db::ThrowIfError(repository_->UpsertCooldown(tx, record), "record cooldown");
}

} // namespace aggregator::core
