#include "decryption_coordinator.hpp"

#include "internal/util/errors.hpp"

namespace aggregator::core {

DecryptionCoordinator::DecryptionCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<AggregationEngine> engine,
                                             std::shared_ptr<oracle::DecryptionOracle> oracle, std::shared_ptr<const access::AccessControl> access,
                                             std::shared_ptr<CooldownTracker> cooldowns, util::NowFn now)
    : repository_(std::move(repository)),
      engine_(std::move(engine)),
      oracle_(std::move(oracle)),
      access_(std::move(access)),
      cooldowns_(std::move(cooldowns)),
      now_(std::move(now)) {
}

DecryptionTicket DecryptionCoordinator::RequestAggregateDecryption(db::Transaction& tx, uint64_t batch_id, const std::string& requester,
                                                                   oracle::ResumeFn resume, EventBuffer& events) {
  if (access_->IsPaused()) {
    throw util::Paused("request decryption: service is paused");
  }
  cooldowns_->Check(tx, db::model::CooldownScope::kDecryptionRequest, requester, access_->DecryptionRequestCooldown());

  const auto aggregate = engine_->Compute(tx, batch_id);

  // If the transaction fails after this call the oracle holds an orphan
  // request; its callback is later rejected as unknown.
  const auto request_id = oracle_->RequestDecryption(aggregate.sum, std::move(resume));

  db::model::DecryptionContextRecord context;
  context.request_id      = request_id;
  context.batch_id        = batch_id;
  context.state_hash      = aggregate.commitment;
  context.processed       = false;
  context.requester       = requester;
  context.data_count      = aggregate.data_count;
  context.requested_at_ms = util::ToUnixMillis(now_());

  db::ThrowIfError(repository_->InsertDecryptionContext(tx, context), "record decryption request " + std::to_string(request_id));
  cooldowns_->Touch(tx, db::model::CooldownScope::kDecryptionRequest, requester);

  EmitDecryptionRequested(events, request_id, batch_id, aggregate.commitment);

  DecryptionTicket ticket;
  ticket.request_id = request_id;
  ticket.batch_id   = batch_id;
  ticket.commitment = aggregate.commitment;
  return ticket;
}

} // namespace aggregator::core
