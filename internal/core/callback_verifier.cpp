#include "callback_verifier.hpp"

#include "internal/crypto/digest.hpp"
#include "internal/oracle/cleartext.hpp"
#include "internal/util/errors.hpp"

namespace aggregator::core {

CallbackVerifier::CallbackVerifier(std::shared_ptr<db::Repository> repository, std::shared_ptr<AggregationEngine> engine,
                                   std::shared_ptr<const oracle::AttestationVerifier> verifier, util::NowFn now)
    : repository_(std::move(repository)), engine_(std::move(engine)), verifier_(std::move(verifier)), now_(std::move(now)) {
}

Finalization CallbackVerifier::OnDecryptionResult(db::Transaction& tx, uint64_t request_id, const std::string& cleartext, const std::string& attestation,
                                                  EventBuffer& events) {
  const std::string prefix = "decryption result " + std::to_string(request_id) + ": ";

  auto context = repository_->GetDecryptionContext(tx, request_id);
  if (!context) {
    throw util::UnknownRequest(prefix + "no such request");
  }
  if (context->processed) {
    throw util::ReplayAttempt(prefix + "already processed");
  }

  const auto aggregate = engine_->Compute(tx, context->batch_id);

  if (!crypto::ConstantTimeEquals(aggregate.commitment, context->state_hash)) {
    throw util::StateMismatch(prefix + "batch " + std::to_string(context->batch_id) + " changed since the request was issued");
  }

  if (!verifier_->Verify(request_id, cleartext, attestation)) {
    throw util::InvalidProof(prefix + "attestation does not verify");
  }

  const auto sum = oracle::DecodeCleartext(cleartext);
  if (!sum) {
    throw util::MalformedCleartext(prefix + "expected " + std::to_string(oracle::kCleartextSize) + " bytes, got " + std::to_string(cleartext.size()));
  }

  context->processed       = true;
  context->average         = *sum / aggregate.data_count;
  context->completed_at_ms = util::ToUnixMillis(now_());
  db::ThrowIfError(repository_->UpdateDecryptionContext(tx, *context), "finalize decryption request " + std::to_string(request_id));

  EmitDecryptionCompleted(events, request_id, context->batch_id, context->average);

  Finalization result;
  result.request_id = request_id;
  result.batch_id   = context->batch_id;
  result.average    = context->average;
  return result;
}

} // namespace aggregator::core
