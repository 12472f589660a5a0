#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "aggregator/v1/events.pb.h"

namespace aggregator::core {

// Events raised by one operation; published only after its transaction commits.
using EventBuffer = std::vector<aggregator::v1::Event>;

inline void EmitBatchOpened(EventBuffer& events, uint64_t batch_id) {
  aggregator::v1::Event event;
  event.mutable_batch_opened()->set_batch_id(batch_id);
  events.push_back(std::move(event));
}

inline void EmitBatchClosed(EventBuffer& events, uint64_t batch_id) {
  aggregator::v1::Event event;
  event.mutable_batch_closed()->set_batch_id(batch_id);
  events.push_back(std::move(event));
}

inline void EmitDataSubmitted(EventBuffer& events, const std::string& submitter, uint64_t batch_id, uint64_t index, const std::string& fingerprint) {
  aggregator::v1::Event event;
  auto*                 body = event.mutable_data_submitted();
  body->set_submitter(submitter);
  body->set_batch_id(batch_id);
  body->set_index(index);
  body->set_fingerprint(fingerprint);
  events.push_back(std::move(event));
}

inline void EmitDecryptionRequested(EventBuffer& events, uint64_t request_id, uint64_t batch_id, const std::string& commitment) {
  aggregator::v1::Event event;
  auto*                 body = event.mutable_decryption_requested();
  body->set_request_id(request_id);
  body->set_batch_id(batch_id);
  body->set_commitment(commitment);
  events.push_back(std::move(event));
}

inline void EmitDecryptionCompleted(EventBuffer& events, uint64_t request_id, uint64_t batch_id, uint64_t average) {
  aggregator::v1::Event event;
  auto*                 body = event.mutable_decryption_completed();
  body->set_request_id(request_id);
  body->set_batch_id(batch_id);
  body->set_average(average);
  events.push_back(std::move(event));
}

} // namespace aggregator::core
