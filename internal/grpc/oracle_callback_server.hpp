#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "aggregator/v1/oracle_callback_service.grpc.pb.h"
#include "internal/service/oracle_callback_service.hpp"

namespace aggregator::grpc {

class OracleCallbackServer final : public aggregator::v1::OracleCallbackService::Service {
 public:
  explicit OracleCallbackServer(std::shared_ptr<aggregator::service::OracleCallbackService> svc);

  ::grpc::Status DeliverDecryptionResult(::grpc::ServerContext*, const aggregator::v1::DeliverDecryptionResultRequest*,
                                         aggregator::v1::DeliverDecryptionResultResponse*) override;

 private:
  std::shared_ptr<aggregator::service::OracleCallbackService> service_;
};

} // namespace aggregator::grpc
