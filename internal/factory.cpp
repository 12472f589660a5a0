#include "factory.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/crypto/digest.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/oracle/hmac_attestation.hpp"
#include "internal/oracle/local_oracle.hpp"
#include "internal/util/hex.hpp"
#if AGGREGATOR_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace aggregator::factory {

namespace {

constexpr std::size_t kGeneratedKeySize = 32;

util::UUID ResolveInstanceId(const aggregator::runtime::config::RuntimeConfig& config) {
  if (!config.instance().id().empty()) {
    return util::FromString(config.instance().id());
  }

  if (config.database().has_sqlite()) {
    throw std::runtime_error("instance.id is required with database.sqlite");
  }
  return util::GenerateUUID();
}

std::string ResolveAttestationKey(const aggregator::runtime::config::RuntimeConfig& config) {
  if (!config.oracle().attestation_key_hex().empty()) {
    return util::FromHex(config.oracle().attestation_key_hex());
  }

  AGGREGATOR_LOG_INFO("oracle.attestation_key_hex not configured; using an ephemeral key");
  return crypto::RandomBytes(kGeneratedKeySize);
}

oracle::RequestId NextRequestId(db::Repository& repository) {
  auto tx       = repository.Begin();
  auto contexts = repository.ListDecryptionContexts(*tx, false, 0);
  tx->Commit();

  oracle::RequestId last = 0;
  for (const auto& context : contexts) {
    last = std::max<oracle::RequestId>(last, context.request_id);
  }
  return last + 1;
}

} // namespace

void Runtime::Shutdown() {
  if (decryption_worker) decryption_worker->Stop();
}

std::shared_ptr<db::Repository> BuildRepository(const aggregator::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if AGGREGATOR_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    AGGREGATOR_LOG_INFO("using sqlite repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  AGGREGATOR_LOG_INFO("using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

access::AccessPolicy BuildAccessPolicy(const aggregator::runtime::config::RuntimeConfig& config) {
  access::AccessPolicy policy;
  policy.owner  = config.access().owner();
  policy.paused = config.access().paused();
  for (const auto& provider : config.access().providers()) {
    policy.providers.insert(provider);
  }
  policy.submission_cooldown         = util::ParseDuration(config.cooldowns().submission());
  policy.decryption_request_cooldown = util::ParseDuration(config.cooldowns().decryption_request());
  return policy;
}

/*
    Build full application dependency graph
*/
Runtime BuildRuntime(const aggregator::runtime::config::RuntimeConfig& config, util::NowFn now) {
  Runtime rt;

  // ------------------------------------------------------------------
  // Persistence and policy
  // ------------------------------------------------------------------
  rt.instance_id = ResolveInstanceId(config);
  rt.repository  = BuildRepository(config);
  rt.access      = std::make_shared<access::StaticAccessControl>(BuildAccessPolicy(config));
  rt.journal     = std::make_shared<observability::EventJournal>(config.events().journal_capacity(), now);

  // ------------------------------------------------------------------
  // Ciphertext backend and development oracle
  // ------------------------------------------------------------------
  rt.backend      = std::make_shared<fhe::PlaintextCiphertextBackend>();
  rt.oracle_queue = std::make_shared<oracle::DecryptionQueue>();

  const auto key      = ResolveAttestationKey(config);
  auto       attestor = std::make_shared<oracle::HmacAttestor>(key);
  auto       verifier = std::make_shared<oracle::HmacAttestationVerifier>(key);
  auto local_oracle   = std::make_shared<oracle::LocalDecryptionOracle>(rt.oracle_queue, NextRequestId(*rt.repository));

  rt.decryption_worker =
      std::make_shared<oracle::DecryptionWorker>(rt.oracle_queue, rt.backend, attestor, util::ParseDuration(config.oracle().delivery_delay()));

  // ------------------------------------------------------------------
  // Core
  // ------------------------------------------------------------------
  core::BatchAggregatorDeps deps;
  deps.repository  = rt.repository;
  deps.backend     = rt.backend;
  deps.oracle      = local_oracle;
  deps.verifier    = verifier;
  deps.access      = rt.access;
  deps.events      = rt.journal;
  deps.instance_id = rt.instance_id;
  deps.now         = std::move(now);

  rt.aggregator = std::make_shared<core::BatchAggregator>(std::move(deps));
  rt.aggregator->Initialize();

  rt.decryption_worker->Start();

  AGGREGATOR_LOG_INFO("batch aggregator ready", {observability::StringField("instance_id", util::ToString(rt.instance_id)),
                                                 observability::IntField("open_batch", static_cast<int64_t>(rt.aggregator->CurrentBatch().id))});
  return rt;
}

} // namespace aggregator::factory
