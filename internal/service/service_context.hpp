#pragma once

#include <memory>

namespace aggregator::core {
class BatchAggregator;
}
namespace aggregator::observability {
class EventJournal;
}

namespace aggregator::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<aggregator::core::BatchAggregator>       aggregator;
  std::shared_ptr<aggregator::observability::EventJournal> journal;
};

} // namespace aggregator::service
