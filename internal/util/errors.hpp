#pragma once

#include <stdexcept>
#include <string>

namespace aggregator::util {

/*
  Central error types.

  Every operation that raises one of these aborts as a whole; nothing it
  touched is committed. These get translated later to gRPC status codes.
*/

// ---------------------------------------------------------------------
// Authorization
// ---------------------------------------------------------------------

class NotProvider : public std::runtime_error {
 public:
  explicit NotProvider(const std::string& msg) : std::runtime_error(msg) {
  }
};

class Unauthorized : public std::runtime_error {
 public:
  explicit Unauthorized(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ---------------------------------------------------------------------
// Availability / rate limiting
// ---------------------------------------------------------------------

class Paused : public std::runtime_error {
 public:
  explicit Paused(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CooldownActive : public std::runtime_error {
 public:
  explicit CooldownActive(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ---------------------------------------------------------------------
// Batch lifecycle consistency
// ---------------------------------------------------------------------

class InvalidBatch : public std::runtime_error {
 public:
  explicit InvalidBatch(const std::string& msg) : std::runtime_error(msg) {
  }
};

class BatchClosedOrInvalid : public std::runtime_error {
 public:
  explicit BatchClosedOrInvalid(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ---------------------------------------------------------------------
// Decryption protocol integrity
// ---------------------------------------------------------------------

class ReplayAttempt : public std::runtime_error {
 public:
  explicit ReplayAttempt(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StateMismatch : public std::runtime_error {
 public:
  explicit StateMismatch(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidProof : public std::runtime_error {
 public:
  explicit InvalidProof(const std::string& msg) : std::runtime_error(msg) {
  }
};

// ---------------------------------------------------------------------
// Input / lookup
// ---------------------------------------------------------------------

class InvalidCiphertext : public std::runtime_error {
 public:
  explicit InvalidCiphertext(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MalformedCleartext : public std::runtime_error {
 public:
  explicit MalformedCleartext(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnknownRequest : public std::runtime_error {
 public:
  explicit UnknownRequest(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace aggregator::util
