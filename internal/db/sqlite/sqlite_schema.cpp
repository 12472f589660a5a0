#include "sqlite_schema.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include "internal/observability/logging.hpp"

namespace aggregator::db::sqlite {

namespace {

constexpr int64_t kSchemaVersion = 1;

const std::vector<std::string>& SchemaV1() {
  static const std::vector<std::string> kStatements = {
      "CREATE TABLE IF NOT EXISTS batches (id INTEGER PRIMARY KEY, data_count INTEGER NOT NULL, closed INTEGER NOT NULL, opened_at_ms INTEGER NOT "
      "NULL, closed_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS ciphertexts (batch_id INTEGER NOT NULL REFERENCES batches(id), idx INTEGER NOT NULL, handle BLOB NOT NULL, "
      "submitter TEXT NOT NULL, fingerprint BLOB NOT NULL, submitted_at_ms INTEGER NOT NULL, PRIMARY KEY (batch_id, idx));",
      "CREATE TABLE IF NOT EXISTS cooldowns (scope INTEGER NOT NULL, identity TEXT NOT NULL, last_action_ms INTEGER NOT NULL, PRIMARY KEY (scope, "
      "identity));",
      "CREATE TABLE IF NOT EXISTS decryption_contexts (request_id INTEGER PRIMARY KEY, batch_id INTEGER NOT NULL REFERENCES batches(id), state_hash "
      "BLOB NOT NULL, processed INTEGER NOT NULL, requester TEXT NOT NULL, data_count INTEGER NOT NULL, requested_at_ms INTEGER NOT NULL, average "
      "INTEGER NOT NULL DEFAULT 0, completed_at_ms INTEGER NOT NULL DEFAULT 0);",
      "CREATE INDEX IF NOT EXISTS decryption_contexts_pending ON decryption_contexts(processed, request_id);"};
  return kStatements;
}

} // namespace

void BootstrapSchema(SqliteDB& db) {
  const auto version = db.UserVersion();
  if (version > kSchemaVersion) {
    throw std::runtime_error("sqlite '" + db.Path() + "': schema version " + std::to_string(version) + " is newer than supported version " +
                             std::to_string(kSchemaVersion));
  }
  if (version == kSchemaVersion) {
    return;
  }

  db.Exec("BEGIN IMMEDIATE;");
  try {
    for (const auto& sql : SchemaV1()) {
      db.Exec(sql);
    }
    db.SetUserVersion(kSchemaVersion);
    db.Exec("COMMIT;");
  } catch (const std::exception&) {
    db.Exec("ROLLBACK;");
    throw;
  }

  AGGREGATOR_LOG_INFO("sqlite schema bootstrapped", {observability::StringField("path", db.Path()),
                                                     observability::IntField("version", kSchemaVersion)});
}

} // namespace aggregator::db::sqlite
