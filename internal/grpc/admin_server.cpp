#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace aggregator::grpc {

using namespace aggregator::v1;

AdminServer::AdminServer(std::shared_ptr<aggregator::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::Stats(::grpc::ServerContext*, const StatsRequest* req, StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ListPendingRequests(::grpc::ServerContext*, const ListPendingRequestsRequest* req, ListPendingRequestsResponse* resp) {
  try {
    *resp = service_->ListPendingRequests(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ListEvents(::grpc::ServerContext*, const ListEventsRequest* req, ListEventsResponse* resp) {
  try {
    *resp = service_->ListEvents(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace aggregator::grpc
