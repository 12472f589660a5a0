#pragma once

#include "aggregator/v1/aggregator_service.pb.h"
#include "service_context.hpp"

namespace aggregator::service {

class AggregationService {
 public:
  explicit AggregationService(ServiceContext ctx);

  aggregator::v1::SubmitResponse Submit(const aggregator::v1::SubmitRequest& req);

  aggregator::v1::CloseBatchResponse CloseBatch(const aggregator::v1::CloseBatchRequest& req);

  aggregator::v1::RequestAggregateDecryptionResponse RequestAggregateDecryption(const aggregator::v1::RequestAggregateDecryptionRequest& req);

  aggregator::v1::GetBatchResponse GetBatch(const aggregator::v1::GetBatchRequest& req);

  aggregator::v1::GetDecryptionRequestResponse GetDecryptionRequest(const aggregator::v1::GetDecryptionRequestRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace aggregator::service
