#include "admin_service.hpp"

#include "conversions.hpp"
#include "internal/core/batch_aggregator.hpp"
#include "internal/observability/events.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"

namespace aggregator::service {

using namespace aggregator::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", [&] {
    const auto stats = ctx_.aggregator->Stats();

    StatsResponse resp;
    resp.set_open_batch_id(stats.open_batch_id);
    resp.set_batches(stats.batches);
    resp.set_submissions(stats.submissions);
    resp.set_pending_requests(stats.pending_requests);
    resp.set_completed_requests(stats.completed_requests);
    return resp;
  });
}

ListPendingRequestsResponse AdminService::ListPendingRequests(const ListPendingRequestsRequest& req) {
  return ObserveRpc("AdminService.ListPendingRequests", [&] {
    ListPendingRequestsResponse resp;
    for (const auto& context : ctx_.aggregator->ListPendingRequests(req.limit())) {
      *resp.add_requests() = ToProto(context);
    }
    return resp;
  });
}

ListEventsResponse AdminService::ListEvents(const ListEventsRequest& req) {
  return ObserveRpc("AdminService.ListEvents", [&] {
    if (!ctx_.journal) {
      throw util::NotFound("event journal is not enabled");
    }

    auto page = ctx_.journal->Read(req.from_sequence(), req.max_events());

    ListEventsResponse resp;
    for (auto& event : page.events) {
      *resp.add_events() = std::move(event);
    }
    resp.set_next_sequence(page.next_sequence);
    return resp;
  });
}

} // namespace aggregator::service
