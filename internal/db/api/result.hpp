#pragma once

#include <string>
#include <string_view>

namespace heartbeat::db {

/*
  Backend-neutral outcome of a repository write.

  SQLite and Postgres errors are folded into these codes inside the
  backend; nothing above db/ sees sqlite3 or pqxx error types.
*/

enum class ErrorCode {
  OK = 0,

  // lock held by another writer, or a serialization conflict
  Busy,
  SerializationFailure,

  AlreadyExists,
  ConstraintViolation,

  IOError,
  Corruption,

  InternalError
};

inline std::string_view ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK: return "ok";
    case ErrorCode::Busy: return "busy";
    case ErrorCode::SerializationFailure: return "serialization_failure";
    case ErrorCode::AlreadyExists: return "already_exists";
    case ErrorCode::ConstraintViolation: return "constraint_violation";
    case ErrorCode::IOError: return "io_error";
    case ErrorCode::Corruption: return "corruption";
    case ErrorCode::InternalError: return "internal_error";
  }
  return "internal_error";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() {
    return {};
  }

  static Result Err(ErrorCode c, std::string msg = {}) {
    return {c, std::move(msg)};
  }

  explicit operator bool() const {
    return code == ErrorCode::OK;
  }

  // The same write may succeed once the competing transaction finishes.
  bool Retryable() const {
    return code == ErrorCode::Busy || code == ErrorCode::SerializationFailure;
  }

  std::string Describe() const {
    std::string out(ToString(code));
    if (!message.empty()) {
      out += ": ";
      out += message;
    }
    return out;
  }
};

} // namespace heartbeat::db
