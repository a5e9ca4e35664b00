#pragma once

#include <stdexcept>
#include <string>

namespace heartbeat::util {

/*
  Central error types.

  These get translated later to gRPC status codes.

    ValidationError  -> INVALID_ARGUMENT   (caller error, do not retry)
    AuthError        -> UNAUTHENTICATED    (bad/missing proof of identity)
    ConfigError      -> FAILED_PRECONDITION (host is missing a secret/token)
    NotFound         -> NOT_FOUND
    StorageError     -> UNAVAILABLE when retryable, else INTERNAL
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MissingFieldError : public ValidationError {
 public:
  explicit MissingFieldError(const std::string& msg) : ValidationError(msg) {
  }
};

class MissingIdError : public MissingFieldError {
 public:
  MissingIdError() : MissingFieldError("missing id") {
  }
};

class InvalidTimestampError : public ValidationError {
 public:
  explicit InvalidTimestampError(const std::string& msg) : ValidationError(msg) {
  }
};

class AuthError : public std::runtime_error {
 public:
  explicit AuthError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class UnauthorizedError : public AuthError {
 public:
  explicit UnauthorizedError(const std::string& msg) : AuthError(msg) {
  }
};

class SkewError : public AuthError {
 public:
  explicit SkewError(const std::string& msg) : AuthError(msg) {
  }
};

class BadSignatureError : public AuthError {
 public:
  explicit BadSignatureError(const std::string& msg) : AuthError(msg) {
  }
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class StorageError : public std::runtime_error {
 public:
  StorageError(const std::string& msg, bool retryable) : std::runtime_error(msg), retryable_(retryable) {
  }

  bool retryable() const {
    return retryable_;
  }

 private:
  bool retryable_;
};

// Raised by webhook delivery; the alert worker logs and drops it.
class TransientDeliveryError : public std::runtime_error {
 public:
  explicit TransientDeliveryError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace heartbeat::util
