#include "conversions.hpp"

#include "internal/util/time.hpp"

namespace aggregator::service {

aggregator::v1::Batch ToProto(const db::model::BatchRecord& record) {
  aggregator::v1::Batch batch;
  batch.set_id(record.id);
  batch.set_data_count(record.data_count);
  batch.set_closed(record.closed);
  *batch.mutable_opened_at() = util::ToProto(util::FromUnixMillis(record.opened_at_ms));
  if (record.closed) {
    *batch.mutable_closed_at() = util::ToProto(util::FromUnixMillis(record.closed_at_ms));
  }
  return batch;
}

aggregator::v1::DecryptionRequestInfo ToProto(const db::model::DecryptionContextRecord& record) {
  aggregator::v1::DecryptionRequestInfo info;
  info.set_request_id(record.request_id);
  info.set_batch_id(record.batch_id);
  info.set_state_hash(record.state_hash);
  info.set_status(record.processed ? aggregator::v1::DECRYPTION_STATUS_COMPLETED : aggregator::v1::DECRYPTION_STATUS_PENDING);
  info.set_requester(record.requester);
  info.set_data_count(record.data_count);
  *info.mutable_requested_at() = util::ToProto(util::FromUnixMillis(record.requested_at_ms));
  if (record.processed) {
    info.set_average(record.average);
    *info.mutable_completed_at() = util::ToProto(util::FromUnixMillis(record.completed_at_ms));
  }
  return info;
}

} // namespace aggregator::service
