#include "services.hpp"

#include "admin_server.hpp"
#include "aggregator_server.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/aggregation_service.hpp"
#include "internal/service/oracle_callback_service.hpp"
#include "internal/service/service_context.hpp"
#include "oracle_callback_server.hpp"

namespace aggregator::grpc {

std::vector<std::unique_ptr<::grpc::Service>> BuildServices(const factory::Runtime& rt) {
  service::ServiceContext ctx;
  ctx.aggregator = rt.aggregator;
  ctx.journal    = rt.journal;

  auto aggregation_service = std::make_shared<service::AggregationService>(ctx);
  auto callback_service    = std::make_shared<service::OracleCallbackService>(ctx);
  auto admin_service       = std::make_shared<service::AdminService>(ctx);

  std::vector<std::unique_ptr<::grpc::Service>> services;
  services.push_back(std::make_unique<AggregatorServer>(aggregation_service));
  services.push_back(std::make_unique<OracleCallbackServer>(callback_service));
  services.push_back(std::make_unique<AdminServer>(admin_service));
  return services;
}

} // namespace aggregator::grpc
