#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "aggregator/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace aggregator::grpc {

class AdminServer final : public aggregator::v1::AdminService::Service {
 public:
  explicit AdminServer(std::shared_ptr<aggregator::service::AdminService> svc);

  ::grpc::Status Stats(::grpc::ServerContext*, const aggregator::v1::StatsRequest*, aggregator::v1::StatsResponse*) override;

  ::grpc::Status ListPendingRequests(::grpc::ServerContext*, const aggregator::v1::ListPendingRequestsRequest*,
                                     aggregator::v1::ListPendingRequestsResponse*) override;

  ::grpc::Status ListEvents(::grpc::ServerContext*, const aggregator::v1::ListEventsRequest*, aggregator::v1::ListEventsResponse*) override;

 private:
  std::shared_ptr<aggregator::service::AdminService> service_;
};

} // namespace aggregator::grpc
