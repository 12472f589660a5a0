#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "internal/factory.hpp"

namespace aggregator::grpc {

// Transport adapters over the runtime's services, ready for runtime::Server.
std::vector<std::unique_ptr<::grpc::Service>> BuildServices(const factory::Runtime& rt);

} // namespace aggregator::grpc
