#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/batch_record.hpp"
#include "internal/db/model/ciphertext_record.hpp"
#include "internal/db/model/cooldown_record.hpp"
#include "internal/db/model/decryption_context_record.hpp"

namespace aggregator::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A failed operation rolls back as a whole; the core relies on this
    for "no partial effect"
  - Reads return nullopt / empty only for absent rows; a backend failure
    during a read throws instead of looking like "not found"

  The DB is the source of truth for:
    batches and their ciphertexts
    cooldown timestamps
    decryption contexts
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Batches
  // ---------------------------------------------------------------------

  virtual Result InsertBatch(Transaction&, const model::BatchRecord&) = 0;

  virtual std::optional<model::BatchRecord> GetBatch(Transaction&, uint64_t batch_id) = 0;

  virtual Result UpdateBatch(Transaction&, const model::BatchRecord&) = 0;

  // Highest batch id, nullopt before the first batch is opened.
  virtual std::optional<uint64_t> GetCurrentBatchId(Transaction&) = 0;

  virtual std::vector<model::BatchRecord> ListBatches(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Ciphertexts
  // ---------------------------------------------------------------------

  virtual Result AppendCiphertext(Transaction&, const model::CiphertextRecord&) = 0;

  // Ordered by index.
  virtual std::vector<model::CiphertextRecord> ListCiphertexts(Transaction&, uint64_t batch_id) = 0;

  virtual uint64_t CountCiphertexts(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Cooldowns
  // ---------------------------------------------------------------------

  virtual std::optional<model::CooldownRecord> GetCooldown(Transaction&, model::CooldownScope scope, const std::string& identity) = 0;

  virtual Result UpsertCooldown(Transaction&, const model::CooldownRecord&) = 0;

  // ---------------------------------------------------------------------
  // Decryption contexts
  // ---------------------------------------------------------------------

  virtual Result InsertDecryptionContext(Transaction&, const model::DecryptionContextRecord&) = 0;

  virtual std::optional<model::DecryptionContextRecord> GetDecryptionContext(Transaction&, uint64_t request_id) = 0;

  virtual Result UpdateDecryptionContext(Transaction&, const model::DecryptionContextRecord&) = 0;

  // Ordered by request id. limit == 0 means no limit.
  virtual std::vector<model::DecryptionContextRecord> ListDecryptionContexts(Transaction&, bool pending_only, uint64_t limit) = 0;
};

} // namespace aggregator::db
