#include "submission_ledger.hpp"

#include "internal/util/errors.hpp"

namespace aggregator::core {

SubmissionLedger::SubmissionLedger(std::shared_ptr<db::Repository> repository, std::shared_ptr<BatchRegistry> registry,
                                   std::shared_ptr<fhe::CiphertextBackend> backend, std::shared_ptr<const access::AccessControl> access,
                                   std::shared_ptr<CooldownTracker> cooldowns, util::NowFn now)
    : repository_(std::move(repository)),
      registry_(std::move(registry)),
      backend_(std::move(backend)),
      access_(std::move(access)),
      cooldowns_(std::move(cooldowns)),
      now_(std::move(now)) {
}

SubmissionReceipt SubmissionLedger::Submit(db::Transaction& tx, const std::string& submitter, const fhe::CiphertextHandle& value, EventBuffer& events) {
  if (!access_->IsProvider(submitter)) {
    throw util::NotProvider("submit: '" + submitter + "' is not an enrolled data provider");
  }
  if (access_->IsPaused()) {
    throw util::Paused("submit: submissions are paused");
  }
  cooldowns_->Check(tx, db::model::CooldownScope::kSubmission, submitter, access_->SubmissionCooldown());

  auto batch = registry_->Current(tx);
  if (!batch || batch->closed) {
    throw util::BatchClosedOrInvalid("submit: no open batch");
  }

  if (!backend_->IsWellFormed(value)) {
    throw util::InvalidCiphertext("submit: ciphertext is not well formed");
  }

  // Fingerprint the initialized form; the stored bytes stay as submitted.
  fhe::CiphertextHandle initialized = value;
  backend_->InitializeIfNeeded(initialized);

  db::model::CiphertextRecord record;
  record.batch_id        = batch->id;
  record.index           = batch->data_count;
  record.handle          = value.bytes;
  record.submitter       = submitter;
  record.fingerprint     = backend_->Fingerprint(initialized);
  record.submitted_at_ms = util::ToUnixMillis(now_());

  db::ThrowIfError(repository_->AppendCiphertext(tx, record), "append ciphertext to batch " + std::to_string(record.batch_id));
  registry_->RecordSubmission(tx, *batch);
  cooldowns_->Touch(tx, db::model::CooldownScope::kSubmission, submitter);

  EmitDataSubmitted(events, submitter, record.batch_id, record.index, record.fingerprint);

  SubmissionReceipt receipt;
  receipt.batch_id    = record.batch_id;
  receipt.index       = record.index;
  receipt.fingerprint = record.fingerprint;
  return receipt;
}

std::vector<fhe::CiphertextHandle> SubmissionLedger::Values(db::Transaction& tx, uint64_t batch_id) const {
  const auto records = repository_->ListCiphertexts(tx, batch_id);

  std::vector<fhe::CiphertextHandle> values;
  values.reserve(records.size());
  for (const auto& record : records) {
    values.push_back(fhe::CiphertextHandle{record.handle});
  }
  return values;
}

} // namespace aggregator::core
