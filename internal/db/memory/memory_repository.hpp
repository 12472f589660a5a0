#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace aggregator::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                             InsertBatch(Transaction&, const model::BatchRecord&) override;
  std::optional<model::BatchRecord>  GetBatch(Transaction&, uint64_t batch_id) override;
  Result                             UpdateBatch(Transaction&, const model::BatchRecord&) override;
  std::optional<uint64_t>            GetCurrentBatchId(Transaction&) override;
  std::vector<model::BatchRecord>    ListBatches(Transaction&) override;

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
  friend class MemoryTransaction;

  using CooldownKey = std::pair<model::CooldownScope, std::string>;

  struct State {
    std::map<uint64_t, model::BatchRecord>                   batches;
    std::map<uint64_t, std::vector<model::CiphertextRecord>> ciphertexts;
    std::map<CooldownKey, model::CooldownRecord>             cooldowns;
    std::map<uint64_t, model::DecryptionContextRecord>       contexts;
  };

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace aggregator::db::memory
