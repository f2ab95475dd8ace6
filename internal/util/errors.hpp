#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace escrow::util {

/*
  Central error types.

  Every rejected ledger operation throws one of these. The code travels with
  the exception so the transport layer can translate it to a gRPC status and
  clients can recover the exact failure.
*/

enum class EscrowErrorCode {
  kInvalidAmount,
  kTaskNotFound,
  kInvalidStatus,
  kUnauthorized,
  kExceedsBudget,
  kAlreadyPaid,
  kTransferFailed,
  kFeeTooHigh,
  kInvalidAddress,
  kWorkAlreadyStarted,
  kReentrantCall,
};

std::string_view ToString(EscrowErrorCode code);

class EscrowError : public std::runtime_error {
 public:
  EscrowError(EscrowErrorCode code, const std::string& msg) : std::runtime_error(msg), code_(code) {
  }

  EscrowErrorCode code() const noexcept {
    return code_;
  }

 private:
  EscrowErrorCode code_;
};

class InvalidAmount : public EscrowError {
 public:
  explicit InvalidAmount(const std::string& msg) : EscrowError(EscrowErrorCode::kInvalidAmount, msg) {
  }
};

class TaskNotFound : public EscrowError {
 public:
  explicit TaskNotFound(const std::string& msg) : EscrowError(EscrowErrorCode::kTaskNotFound, msg) {
  }
};

class InvalidStatus : public EscrowError {
 public:
  explicit InvalidStatus(const std::string& msg) : EscrowError(EscrowErrorCode::kInvalidStatus, msg) {
  }
};

class Unauthorized : public EscrowError {
 public:
  explicit Unauthorized(const std::string& msg) : EscrowError(EscrowErrorCode::kUnauthorized, msg) {
  }
};

class ExceedsBudget : public EscrowError {
 public:
  explicit ExceedsBudget(const std::string& msg) : EscrowError(EscrowErrorCode::kExceedsBudget, msg) {
  }
};

class AlreadyPaid : public EscrowError {
 public:
  explicit AlreadyPaid(const std::string& msg) : EscrowError(EscrowErrorCode::kAlreadyPaid, msg) {
  }
};

class TransferFailed : public EscrowError {
 public:
  explicit TransferFailed(const std::string& msg) : EscrowError(EscrowErrorCode::kTransferFailed, msg) {
  }
};

class FeeTooHigh : public EscrowError {
 public:
  explicit FeeTooHigh(const std::string& msg) : EscrowError(EscrowErrorCode::kFeeTooHigh, msg) {
  }
};

class InvalidAddress : public EscrowError {
 public:
  explicit InvalidAddress(const std::string& msg) : EscrowError(EscrowErrorCode::kInvalidAddress, msg) {
  }
};

class WorkAlreadyStarted : public EscrowError {
 public:
  explicit WorkAlreadyStarted(const std::string& msg) : EscrowError(EscrowErrorCode::kWorkAlreadyStarted, msg) {
  }
};

class ReentrantCall : public EscrowError {
 public:
  explicit ReentrantCall(const std::string& msg) : EscrowError(EscrowErrorCode::kReentrantCall, msg) {
  }
};

} // namespace escrow::util
