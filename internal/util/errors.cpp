#include "errors.hpp"

namespace escrow::util {

std::string_view ToString(EscrowErrorCode code) {
  switch (code) {
    case EscrowErrorCode::kInvalidAmount:
      return "INVALID_AMOUNT";
    case EscrowErrorCode::kTaskNotFound:
      return "TASK_NOT_FOUND";
    case EscrowErrorCode::kInvalidStatus:
      return "INVALID_STATUS";
    case EscrowErrorCode::kUnauthorized:
      return "UNAUTHORIZED";
    case EscrowErrorCode::kExceedsBudget:
      return "EXCEEDS_BUDGET";
    case EscrowErrorCode::kAlreadyPaid:
      return "ALREADY_PAID";
    case EscrowErrorCode::kTransferFailed:
      return "TRANSFER_FAILED";
    case EscrowErrorCode::kFeeTooHigh:
      return "FEE_TOO_HIGH";
    case EscrowErrorCode::kInvalidAddress:
      return "INVALID_ADDRESS";
    case EscrowErrorCode::kWorkAlreadyStarted:
      return "WORK_ALREADY_STARTED";
    case EscrowErrorCode::kReentrantCall:
      return "REENTRANT_CALL";
  }
  return "UNKNOWN";
}

} // namespace escrow::util
