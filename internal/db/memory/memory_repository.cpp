#include "memory_repository.hpp"

#include "memory_tx.hpp"

namespace aggregator::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Batches
// ------------------------------------------------------------------

Result MemoryRepository::InsertBatch(Transaction& t, const model::BatchRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.batches.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "batch " + std::to_string(r.id));
  s.batches[r.id] = r;
  return Result::Ok();
}

std::optional<model::BatchRecord> MemoryRepository::GetBatch(Transaction& t, uint64_t batch_id) {
  const auto& s  = TX(t).View();
  auto        it = s.batches.find(batch_id);
  if (it == s.batches.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateBatch(Transaction& t, const model::BatchRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.batches.find(r.id);
  if (it == s.batches.end()) return Result::Err(ErrorCode::NotFound, "batch " + std::to_string(r.id));
  it->second = r;
  return Result::Ok();
}

std::optional<uint64_t> MemoryRepository::GetCurrentBatchId(Transaction& t) {
  const auto& s = TX(t).View();
  if (s.batches.empty()) return std::nullopt;
  return s.batches.rbegin()->first;
}

std::vector<model::BatchRecord> MemoryRepository::ListBatches(Transaction& t) {
  const auto&                     s = TX(t).View();
  std::vector<model::BatchRecord> records;
  records.reserve(s.batches.size());
  for (const auto& [_, record] : s.batches) {
    records.push_back(record);
  }
  return records;
}

// ------------------------------------------------------------------
// Ciphertexts
// ------------------------------------------------------------------

Result MemoryRepository::AppendCiphertext(Transaction& t, const model::CiphertextRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.batches.contains(r.batch_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown batch " + std::to_string(r.batch_id));

  auto& entries = s.ciphertexts[r.batch_id];
  if (r.index < entries.size()) return Result::Err(ErrorCode::AlreadyExists, "ciphertext slot taken");
  if (r.index > entries.size()) return Result::Err(ErrorCode::Conflict, "ciphertext index out of order");

  entries.push_back(r);
  return Result::Ok();
}

std::vector<model::CiphertextRecord> MemoryRepository::ListCiphertexts(Transaction& t, uint64_t batch_id) {
  const auto& s  = TX(t).View();
  auto        it = s.ciphertexts.find(batch_id);
  if (it == s.ciphertexts.end()) return {};
  return it->second;
}

uint64_t MemoryRepository::CountCiphertexts(Transaction& t) {
  uint64_t total = 0;
  for (const auto& [_, entries] : TX(t).View().ciphertexts) {
    total += entries.size();
  }
  return total;
}

// ------------------------------------------------------------------
// Cooldowns
// ------------------------------------------------------------------

std::optional<model::CooldownRecord> MemoryRepository::GetCooldown(Transaction& t, model::CooldownScope scope, const std::string& identity) {
  const auto& s  = TX(t).View();
  auto        it = s.cooldowns.find({scope, identity});
  if (it == s.cooldowns.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpsertCooldown(Transaction& t, const model::CooldownRecord& r) {
  TX(t).Mutable().cooldowns[{r.scope, r.identity}] = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Decryption contexts
// ------------------------------------------------------------------

Result MemoryRepository::InsertDecryptionContext(Transaction& t, const model::DecryptionContextRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.contexts.contains(r.request_id)) return Result::Err(ErrorCode::AlreadyExists, "request " + std::to_string(r.request_id));
  s.contexts[r.request_id] = r;
  return Result::Ok();
}

std::optional<model::DecryptionContextRecord> MemoryRepository::GetDecryptionContext(Transaction& t, uint64_t request_id) {
  const auto& s  = TX(t).View();
  auto        it = s.contexts.find(request_id);
  if (it == s.contexts.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateDecryptionContext(Transaction& t, const model::DecryptionContextRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.contexts.find(r.request_id);
  if (it == s.contexts.end()) return Result::Err(ErrorCode::NotFound, "request " + std::to_string(r.request_id));
  it->second = r;
  return Result::Ok();
}

std::vector<model::DecryptionContextRecord> MemoryRepository::ListDecryptionContexts(Transaction& t, bool pending_only, uint64_t limit) {
  std::vector<model::DecryptionContextRecord> records;
  for (const auto& [_, record] : TX(t).View().contexts) {
    if (pending_only && record.processed) continue;
    records.push_back(record);
    if (limit != 0 && records.size() >= limit) break;
  }
  return records;
}

} // namespace aggregator::db::memory
