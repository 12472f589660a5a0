#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>

namespace aggregator::grpc {

/*
  Maps aggregator errors onto gRPC status codes.

    NotProvider, Unauthorized        PERMISSION_DENIED
    Paused                           UNAVAILABLE
    CooldownActive                   RESOURCE_EXHAUSTED
    InvalidBatch, BatchClosed...     FAILED_PRECONDITION
    ReplayAttempt                    ALREADY_EXISTS
    StateMismatch                    ABORTED
    InvalidProof                     UNAUTHENTICATED
    UnknownRequest, NotFound         NOT_FOUND
    InvalidCiphertext, Malformed...  INVALID_ARGUMENT
    anything else                    INTERNAL
*/
::grpc::Status ToStatus(const std::exception& e);

} // namespace aggregator::grpc
