#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/access/access_control.hpp"
#include "internal/core/batch_aggregator.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/fhe/plaintext_backend.hpp"
#include "internal/observability/events.hpp"
#include "internal/oracle/decryption_queue.hpp"
#include "internal/oracle/decryption_worker.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace aggregator::factory {

/*
  Runtime

  Owns all long-lived objects of the process. Transport adapters are built
  on top of it separately so the core links without gRPC.
*/
struct Runtime {
  std::shared_ptr<db::Repository>                  repository;
  std::shared_ptr<access::StaticAccessControl>     access;
  std::shared_ptr<observability::EventJournal>     journal;
  std::shared_ptr<fhe::PlaintextCiphertextBackend> backend;
  std::shared_ptr<oracle::DecryptionQueue>         oracle_queue;
  std::shared_ptr<oracle::DecryptionWorker>        decryption_worker;
  std::shared_ptr<core::BatchAggregator>           aggregator;
  util::UUID                                       instance_id{};

  // Stops background work; safe to call more than once.
  void Shutdown();
};

/*
  BuildRuntime

  Composition root. The ONLY place allowed to know concrete repository,
  backend and oracle types. Opens batch 1 on a fresh store and starts the
  decryption worker.
*/
Runtime BuildRuntime(const aggregator::runtime::config::RuntimeConfig& config, util::NowFn now = util::Now);

std::shared_ptr<db::Repository> BuildRepository(const aggregator::runtime::config::RuntimeConfig& config);

access::AccessPolicy BuildAccessPolicy(const aggregator::runtime::config::RuntimeConfig& config);

} // namespace aggregator::factory
