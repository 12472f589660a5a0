#include "aggregator_server.hpp"

#include "grpc_error.hpp"

namespace aggregator::grpc {

using namespace aggregator::v1;

AggregatorServer::AggregatorServer(std::shared_ptr<aggregator::service::AggregationService> svc) : service_(std::move(svc)) {
}

::grpc::Status AggregatorServer::Submit(::grpc::ServerContext*, const SubmitRequest* req, SubmitResponse* resp) {
  try {
    *resp = service_->Submit(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AggregatorServer::CloseBatch(::grpc::ServerContext*, const CloseBatchRequest* req, CloseBatchResponse* resp) {
  try {
    *resp = service_->CloseBatch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AggregatorServer::RequestAggregateDecryption(::grpc::ServerContext*, const RequestAggregateDecryptionRequest* req,
                                                            RequestAggregateDecryptionResponse* resp) {
  try {
    *resp = service_->RequestAggregateDecryption(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AggregatorServer::GetBatch(::grpc::ServerContext*, const GetBatchRequest* req, GetBatchResponse* resp) {
  try {
    *resp = service_->GetBatch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AggregatorServer::GetDecryptionRequest(::grpc::ServerContext*, const GetDecryptionRequestRequest* req, GetDecryptionRequestResponse* resp) {
  try {
    *resp = service_->GetDecryptionRequest(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace aggregator::grpc
