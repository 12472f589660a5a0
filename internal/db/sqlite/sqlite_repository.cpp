#include "sqlite_repository.hpp"

#include <sqlite3.h>

namespace aggregator::db::sqlite {

using aggregator::db::ErrorCode;
using aggregator::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& bytes) {
  sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

static std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(size)) : std::string();
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

static sqlite3_stmt* Prepare(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    sqlite3_finalize(st);
    return nullptr;
  }
  return st;
}

static model::BatchRecord ReadBatch(sqlite3_stmt* st) {
  model::BatchRecord r;
  r.id           = ColU64(st, 0);
  r.data_count   = ColU64(st, 1);
  r.closed       = ColI32(st, 2) != 0;
  r.opened_at_ms = ColU64(st, 3);
  r.closed_at_ms = ColU64(st, 4);
  return r;
}

static model::DecryptionContextRecord ReadContext(sqlite3_stmt* st) {
  model::DecryptionContextRecord r;
  r.request_id      = ColU64(st, 0);
  r.batch_id        = ColU64(st, 1);
  r.state_hash      = ColBlob(st, 2);
  r.processed       = ColI32(st, 3) != 0;
  r.requester       = ColText(st, 4);
  r.data_count      = ColU64(st, 5);
  r.requested_at_ms = ColU64(st, 6);
  r.average         = ColU64(st, 7);
  r.completed_at_ms = ColU64(st, 8);
  return r;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (sqlite3_extended_errcode(db) == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      }
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

sqlite3_stmt* SqliteRepository::PrepareRead(sqlite3* db, const char* sql, const char* what) {
  auto* st = Prepare(db, sql);
  if (!st) ThrowIfError(Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db)), what);
  return st;
}

bool SqliteRepository::StepRow(sqlite3* db, sqlite3_stmt* st, const char* what) {
  const int rc = sqlite3_step(st);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;

  auto result = Translate(db, rc);
  sqlite3_finalize(st);
  ThrowIfError(result, what);
  return false;
}

// ------------------------------------------------------------------
// Batches
// ------------------------------------------------------------------

Result SqliteRepository::InsertBatch(Transaction& t, const model::BatchRecord& r) {
  auto* db = TX(t).Handle();

  auto* st = Prepare(db, "INSERT INTO batches(id,data_count,closed,opened_at_ms,closed_at_ms) VALUES(?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st, 1, r.id);
  BindU64(st, 2, r.data_count);
  BindI32(st, 3, r.closed ? 1 : 0);
  BindU64(st, 4, r.opened_at_ms);
  BindU64(st, 5, r.closed_at_ms);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

std::optional<model::BatchRecord> SqliteRepository::GetBatch(Transaction& t, uint64_t batch_id) {
  auto* db = TX(t).Handle();

  auto* st = PrepareRead(db, "SELECT id,data_count,closed,opened_at_ms,closed_at_ms FROM batches WHERE id=?;", "get batch");

  BindU64(st, 1, batch_id);

  if (!StepRow(db, st, "get batch")) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  auto r = ReadBatch(st);
  sqlite3_finalize(st);
  return r;
}

Result SqliteRepository::UpdateBatch(Transaction& t, const model::BatchRecord& r) {
  auto* db = TX(t).Handle();

  auto* st = Prepare(db, "UPDATE batches SET data_count=?,closed=?,opened_at_ms=?,closed_at_ms=? WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st, 1, r.data_count);
  BindI32(st, 2, r.closed ? 1 : 0);
  BindU64(st, 3, r.opened_at_ms);
  BindU64(st, 4, r.closed_at_ms);
  BindU64(st, 5, r.id);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto result = Translate(db, rc);
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "batch " + std::to_string(r.id));
  return result;
}

std::optional<uint64_t> SqliteRepository::GetCurrentBatchId(Transaction& t) {
  auto* db = TX(t).Handle();

  auto* st = PrepareRead(db, "SELECT MAX(id) FROM batches;", "current batch");

  std::optional<uint64_t> id;
  if (StepRow(db, st, "current batch") && sqlite3_column_type(st, 0) != SQLITE_NULL) {
    id = ColU64(st, 0);
  }
  sqlite3_finalize(st);
  return id;
}

std::vector<model::BatchRecord> SqliteRepository::ListBatches(Transaction& t) {
  auto* db = TX(t).Handle();

  auto* st = PrepareRead(db, "SELECT id,data_count,closed,opened_at_ms,closed_at_ms FROM batches ORDER BY id;", "list batches");

  std::vector<model::BatchRecord> out;
  while (StepRow(db, st, "list batches")) {
    out.push_back(ReadBatch(st));
  }
  sqlite3_finalize(st);
  return out;
}

// ------------------------------------------------------------------
// Ciphertexts
// ------------------------------------------------------------------

Result SqliteRepository::AppendCiphertext(Transaction& t, const model::CiphertextRecord& r) {
  auto* db = TX(t).Handle();

  auto* st = Prepare(db,
                     "INSERT INTO ciphertexts(batch_id,idx,handle,submitter,fingerprint,submitted_at_ms) "
                     "VALUES(?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st, 1, r.batch_id);
  BindU64(st, 2, r.index);
  BindBlob(st, 3, r.handle);
  BindText(st, 4, r.submitter);
  BindBlob(st, 5, r.fingerprint);
  BindU64(st, 6, r.submitted_at_ms);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

std::vector<model::CiphertextRecord> SqliteRepository::ListCiphertexts(Transaction& t, uint64_t batch_id) {
  auto* db = TX(t).Handle();

  auto* st = PrepareRead(db,
                         "SELECT batch_id,idx,handle,submitter,fingerprint,submitted_at_ms "
                         "FROM ciphertexts WHERE batch_id=? ORDER BY idx;",
                         "list ciphertexts");

  BindU64(st, 1, batch_id);

  std::vector<model::CiphertextRecord> out;
  while (StepRow(db, st, "list ciphertexts")) {
    model::CiphertextRecord r;
    r.batch_id        = ColU64(st, 0);
    r.index           = ColU64(st, 1);
    r.handle          = ColBlob(st, 2);
    r.submitter       = ColText(st, 3);
    r.fingerprint     = ColBlob(st, 4);
    r.submitted_at_ms = ColU64(st, 5);
    out.push_back(std::move(r));
  }
  sqlite3_finalize(st);
  return out;
}

uint64_t SqliteRepository::CountCiphertexts(Transaction& t) {
  auto* db = TX(t).Handle();

  auto* st = PrepareRead(db, "SELECT COUNT(*) FROM ciphertexts;", "count ciphertexts");

  uint64_t count = 0;
  if (StepRow(db, st, "count ciphertexts")) count = ColU64(st, 0);
  sqlite3_finalize(st);
  return count;
}

// ------------------------------------------------------------------
// Cooldowns
// ------------------------------------------------------------------

std::optional<model::CooldownRecord> SqliteRepository::GetCooldown(Transaction& t, model::CooldownScope scope, const std::string& identity) {
  auto* db = TX(t).Handle();

  auto* st = PrepareRead(db, "SELECT last_action_ms FROM cooldowns WHERE scope=? AND identity=?;", "get cooldown");

  BindI32(st, 1, static_cast<int>(scope));
  BindText(st, 2, identity);

  if (!StepRow(db, st, "get cooldown")) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  model::CooldownRecord r;
  r.scope          = scope;
  r.identity       = identity;
  r.last_action_ms = ColU64(st, 0);

  sqlite3_finalize(st);
  return r;
}

Result SqliteRepository::UpsertCooldown(Transaction& t, const model::CooldownRecord& r) {
  auto* db = TX(t).Handle();

  auto* st = Prepare(db,
                     "INSERT INTO cooldowns(scope,identity,last_action_ms) VALUES(?,?,?) "
                     "ON CONFLICT(scope,identity) DO UPDATE SET last_action_ms=excluded.last_action_ms;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindI32(st, 1, static_cast<int>(r.scope));
  BindText(st, 2, r.identity);
  BindU64(st, 3, r.last_action_ms);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

// ------------------------------------------------------------------
// Decryption contexts
// ------------------------------------------------------------------

Result SqliteRepository::InsertDecryptionContext(Transaction& t, const model::DecryptionContextRecord& r) {
  auto* db = TX(t).Handle();

  auto* st = Prepare(db,
                     "INSERT INTO decryption_contexts(request_id,batch_id,state_hash,processed,requester,data_count,requested_at_ms,average,completed_at_ms) "
                     "VALUES(?,?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st, 1, r.request_id);
  BindU64(st, 2, r.batch_id);
  BindBlob(st, 3, r.state_hash);
  BindI32(st, 4, r.processed ? 1 : 0);
  BindText(st, 5, r.requester);
  BindU64(st, 6, r.data_count);
  BindU64(st, 7, r.requested_at_ms);
  BindU64(st, 8, r.average);
  BindU64(st, 9, r.completed_at_ms);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

std::optional<model::DecryptionContextRecord> SqliteRepository::GetDecryptionContext(Transaction& t, uint64_t request_id) {
  auto* db = TX(t).Handle();

  auto* st = PrepareRead(db,
                         "SELECT request_id,batch_id,state_hash,processed,requester,data_count,requested_at_ms,average,completed_at_ms "
                         "FROM decryption_contexts WHERE request_id=?;",
                         "get decryption context");

  BindU64(st, 1, request_id);

  if (!StepRow(db, st, "get decryption context")) {
    sqlite3_finalize(st);
    return std::nullopt;
  }

  auto r = ReadContext(st);
  sqlite3_finalize(st);
  return r;
}

Result SqliteRepository::UpdateDecryptionContext(Transaction& t, const model::DecryptionContextRecord& r) {
  auto* db = TX(t).Handle();

  auto* st = Prepare(db,
                     "UPDATE decryption_contexts SET batch_id=?,state_hash=?,processed=?,requester=?,data_count=?,requested_at_ms=?,average=?,completed_at_ms=? "
                     "WHERE request_id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st, 1, r.batch_id);
  BindBlob(st, 2, r.state_hash);
  BindI32(st, 3, r.processed ? 1 : 0);
  BindText(st, 4, r.requester);
  BindU64(st, 5, r.data_count);
  BindU64(st, 6, r.requested_at_ms);
  BindU64(st, 7, r.average);
  BindU64(st, 8, r.completed_at_ms);
  BindU64(st, 9, r.request_id);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto result = Translate(db, rc);
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "request " + std::to_string(r.request_id));
  return result;
}

std::vector<model::DecryptionContextRecord> SqliteRepository::ListDecryptionContexts(Transaction& t, bool pending_only, uint64_t limit) {
  auto* db = TX(t).Handle();

  auto* st = Prepare(db,
                     "SELECT request_id,batch_id,state_hash,processed,requester,data_count,requested_at_ms,average,completed_at_ms "
                     "FROM decryption_contexts WHERE (?1 = 0 OR processed = 0) ORDER BY request_id LIMIT ?2;");
  if (!st) ThrowIfError(Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db)), "list decryption contexts");

  BindI32(st, 1, pending_only ? 1 : 0);
  // LIMIT -1 means unbounded in sqlite
  sqlite3_bind_int64(st, 2, limit == 0 ? -1 : static_cast<sqlite3_int64>(limit));

  std::vector<model::DecryptionContextRecord> out;
  while (StepRow(db, st, "list decryption contexts")) {
    out.push_back(ReadContext(st));
  }
  sqlite3_finalize(st);
  return out;
}

} // namespace aggregator::db::sqlite
