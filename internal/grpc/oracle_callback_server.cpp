#include "oracle_callback_server.hpp"

#include "grpc_error.hpp"

namespace aggregator::grpc {

OracleCallbackServer::OracleCallbackServer(std::shared_ptr<aggregator::service::OracleCallbackService> svc) : service_(std::move(svc)) {
}

::grpc::Status OracleCallbackServer::DeliverDecryptionResult(::grpc::ServerContext*, const aggregator::v1::DeliverDecryptionResultRequest* req,
                                                             aggregator::v1::DeliverDecryptionResultResponse* resp) {
  try {
    *resp = service_->DeliverDecryptionResult(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace aggregator::grpc
