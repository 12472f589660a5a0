#include "aggregation_service.hpp"

#include "conversions.hpp"
#include "internal/core/batch_aggregator.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace aggregator::service {

using namespace aggregator::v1;

AggregationService::AggregationService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SubmitResponse AggregationService::Submit(const SubmitRequest& req) {
  return ObserveRpc("BatchAggregatorService.Submit", [&] {
    const auto receipt = ctx_.aggregator->Submit(req.submitter(), fhe::CiphertextHandle{req.ciphertext()});

    SubmitResponse resp;
    resp.set_batch_id(receipt.batch_id);
    resp.set_index(receipt.index);
    resp.set_fingerprint(receipt.fingerprint);
    return resp;
  });
}

CloseBatchResponse AggregationService::CloseBatch(const CloseBatchRequest& req) {
  return ObserveRpc("BatchAggregatorService.CloseBatch", [&] {
    const auto transition = ctx_.aggregator->CloseBatch(req.caller());

    CloseBatchResponse resp;
    *resp.mutable_closed_batch() = ToProto(transition.closed);
    *resp.mutable_opened_batch() = ToProto(transition.opened);
    return resp;
  });
}

RequestAggregateDecryptionResponse AggregationService::RequestAggregateDecryption(const RequestAggregateDecryptionRequest& req) {
  return ObserveRpc("BatchAggregatorService.RequestAggregateDecryption", [&] {
    const auto ticket = ctx_.aggregator->RequestAggregateDecryption(req.requester(), req.batch_id());

    RequestAggregateDecryptionResponse resp;
    resp.set_request_id(ticket.request_id);
    resp.set_commitment(ticket.commitment);
    return resp;
  });
}

GetBatchResponse AggregationService::GetBatch(const GetBatchRequest& req) {
  return ObserveRpc("BatchAggregatorService.GetBatch", [&] {
    GetBatchResponse resp;
    if (req.batch_id() == 0) {
      *resp.mutable_batch() = ToProto(ctx_.aggregator->CurrentBatch());
      return resp;
    }

    const auto batch = ctx_.aggregator->GetBatch(req.batch_id());
    if (!batch) {
      throw util::NotFound("batch " + std::to_string(req.batch_id()) + " does not exist");
    }
    *resp.mutable_batch() = ToProto(*batch);
    return resp;
  });
}

GetDecryptionRequestResponse AggregationService::GetDecryptionRequest(const GetDecryptionRequestRequest& req) {
  return ObserveRpc("BatchAggregatorService.GetDecryptionRequest", [&] {
    const auto context = ctx_.aggregator->GetDecryptionRequest(req.request_id());
    if (!context) {
      throw util::UnknownRequest("decryption request " + std::to_string(req.request_id()) + " does not exist");
    }

    GetDecryptionRequestResponse resp;
    *resp.mutable_request() = ToProto(*context);
    return resp;
  });
}

} // namespace aggregator::service
