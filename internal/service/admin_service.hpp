#pragma once

#include "aggregator/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace aggregator::service {

class AdminService {
 public:
  explicit AdminService(ServiceContext ctx);

  aggregator::v1::StatsResponse Stats(const aggregator::v1::StatsRequest& req);

  aggregator::v1::ListPendingRequestsResponse ListPendingRequests(const aggregator::v1::ListPendingRequestsRequest& req);

  aggregator::v1::ListEventsResponse ListEvents(const aggregator::v1::ListEventsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace aggregator::service
