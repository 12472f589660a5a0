#pragma once

#include "aggregator/v1/oracle_callback_service.pb.h"
#include "service_context.hpp"

namespace aggregator::service {

class OracleCallbackService {
 public:
  explicit OracleCallbackService(ServiceContext ctx);

  aggregator::v1::DeliverDecryptionResultResponse DeliverDecryptionResult(const aggregator::v1::DeliverDecryptionResultRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace aggregator::service
