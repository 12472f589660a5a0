#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "aggregator/v1/aggregator_service.grpc.pb.h"
#include "internal/service/aggregation_service.hpp"

namespace aggregator::grpc {

class AggregatorServer final : public aggregator::v1::BatchAggregatorService::Service {
 public:
  explicit AggregatorServer(std::shared_ptr<aggregator::service::AggregationService> svc);

  ::grpc::Status Submit(::grpc::ServerContext*, const aggregator::v1::SubmitRequest*, aggregator::v1::SubmitResponse*) override;

  ::grpc::Status CloseBatch(::grpc::ServerContext*, const aggregator::v1::CloseBatchRequest*, aggregator::v1::CloseBatchResponse*) override;

  ::grpc::Status RequestAggregateDecryption(::grpc::ServerContext*, const aggregator::v1::RequestAggregateDecryptionRequest*,
                                            aggregator::v1::RequestAggregateDecryptionResponse*) override;

  ::grpc::Status GetBatch(::grpc::ServerContext*, const aggregator::v1::GetBatchRequest*, aggregator::v1::GetBatchResponse*) override;

  ::grpc::Status GetDecryptionRequest(::grpc::ServerContext*, const aggregator::v1::GetDecryptionRequestRequest*,
                                      aggregator::v1::GetDecryptionRequestResponse*) override;

 private:
  std::shared_ptr<aggregator::service::AggregationService> service_;
};

} // namespace aggregator::grpc
