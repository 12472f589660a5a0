#include "oracle_callback_service.hpp"

#include "internal/core/batch_aggregator.hpp"
#include "observe_rpc.hpp"

namespace aggregator::service {

using namespace aggregator::v1;

OracleCallbackService::OracleCallbackService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

DeliverDecryptionResultResponse OracleCallbackService::DeliverDecryptionResult(const DeliverDecryptionResultRequest& req) {
  return ObserveRpc("OracleCallbackService.DeliverDecryptionResult", [&] {
    const auto result = ctx_.aggregator->OnDecryptionResult(req.request_id(), req.cleartext(), req.attestation());

    DeliverDecryptionResultResponse resp;
    resp.set_batch_id(result.batch_id);
    resp.set_average(result.average);
    return resp;
  });
}

} // namespace aggregator::service
