#include "grpc_error.hpp"

#include "internal/util/errors.hpp"

namespace aggregator::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace aggregator::util;

  if (dynamic_cast<const NotProvider*>(&e) || dynamic_cast<const Unauthorized*>(&e)) {
    return {::grpc::StatusCode::PERMISSION_DENIED, e.what()};
  }
  if (dynamic_cast<const Paused*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const CooldownActive*>(&e)) {
    return {::grpc::StatusCode::RESOURCE_EXHAUSTED, e.what()};
  }
  if (dynamic_cast<const InvalidBatch*>(&e) || dynamic_cast<const BatchClosedOrInvalid*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const ReplayAttempt*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const StateMismatch*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const InvalidProof*>(&e)) {
    return {::grpc::StatusCode::UNAUTHENTICATED, e.what()};
  }
  if (dynamic_cast<const UnknownRequest*>(&e) || dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const InvalidCiphertext*>(&e) || dynamic_cast<const MalformedCleartext*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace aggregator::grpc
