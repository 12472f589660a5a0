#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace aggregator::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                            InsertBatch(Transaction&, const model::BatchRecord&) override;
  std::optional<model::BatchRecord> GetBatch(Transaction&, uint64_t batch_id) override;
  Result                            UpdateBatch(Transaction&, const model::BatchRecord&) override;
  std::optional<uint64_t>           GetCurrentBatchId(Transaction&) override;
  std::vector<model::BatchRecord>   ListBatches(Transaction&) override;

  Result                               AppendCiphertext(Transaction&, const model::CiphertextRecord&) override;
  std::vector<model::CiphertextRecord> ListCiphertexts(Transaction&, uint64_t batch_id) override;
  uint64_t                             CountCiphertexts(Transaction&) override;

  std::optional<model::CooldownRecord> GetCooldown(Transaction&, model::CooldownScope scope, const std::string& identity) override;
  Result                               UpsertCooldown(Transaction&, const model::CooldownRecord&) override;

  Result                                        InsertDecryptionContext(Transaction&, const model::DecryptionContextRecord&) override;
  std::optional<model::DecryptionContextRecord> GetDecryptionContext(Transaction&, uint64_t request_id) override;
  Result                                        UpdateDecryptionContext(Transaction&, const model::DecryptionContextRecord&) override;
  std::vector<model::DecryptionContextRecord>   ListDecryptionContexts(Transaction&, bool pending_only, uint64_t limit) override;

 private:
  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  // Read helpers: throw on prepare failure and on any step result other
  // than SQLITE_ROW / SQLITE_DONE. StepRow finalizes before throwing.
  static sqlite3_stmt* PrepareRead(sqlite3* db, const char* sql, const char* what);
  static bool          StepRow(sqlite3* db, sqlite3_stmt* st, const char* what);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace aggregator::db::sqlite
