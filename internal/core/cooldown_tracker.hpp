#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace aggregator::core {

/*
  Per-identity rate limiting.

  An identity with no recorded action is always allowed. A zero interval
  disables the check but Touch() still records the action.
*/
class CooldownTracker {
 public:
  CooldownTracker(std::shared_ptr<db::Repository> repository, util::NowFn now);

  // Throws util::CooldownActive while now < last_action + interval.
  void Check(db::Transaction& tx, db::model::CooldownScope scope, const std::string& identity, util::Duration interval) const;

  void Touch(db::Transaction& tx, db::model::CooldownScope scope, const std::string& identity);

 private:
  std::shared_ptr<db::Repository> repository_;
  util::NowFn                     now_;
};

} // namespace aggregator::core
