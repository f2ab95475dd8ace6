#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace escrow::db {

/*
  Portable repository result codes.

  Backends translate their native errors into these so the ledger never
  depends on sqlite error types. A failed Result inside a ledger mutation
  is fatal for that call: the caller throws and the transaction unwinds.
*/

enum class ErrorCode {
  OK = 0,

  NotFound,      // update/delete matched no row
  AlreadyExists, // duplicate task id, subtask key or admin

  Busy,
  ConstraintViolation,
  IOError,
  Corruption,

  InternalError
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::IOError:
      return "i/o error";
    case ErrorCode::Corruption:
      return "corruption";
    case ErrorCode::InternalError:
      return "internal error";
  }
  return "unknown";
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
};

// Throws std::runtime_error("<context>: <code>[: <message>]") for a failed result.
inline void ThrowIfError(const Result& result, std::string_view context) {
  if (result) {
    return;
  }
  std::string what = std::string(context) + ": " + ToString(result.code);
  if (!result.message.empty()) {
    what += ": " + result.message;
  }
  throw std::runtime_error(what);
}

} // namespace escrow::db
