#include "grpc_error.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace escrow::grpc {

::grpc::StatusCode ToStatusCode(util::EscrowErrorCode code) {
  using util::EscrowErrorCode;

  switch (code) {
    case EscrowErrorCode::kInvalidAmount:
    case EscrowErrorCode::kFeeTooHigh:
    case EscrowErrorCode::kInvalidAddress:
      return ::grpc::StatusCode::INVALID_ARGUMENT;
    case EscrowErrorCode::kTaskNotFound:
      return ::grpc::StatusCode::NOT_FOUND;
    case EscrowErrorCode::kInvalidStatus:
    case EscrowErrorCode::kWorkAlreadyStarted:
      return ::grpc::StatusCode::FAILED_PRECONDITION;
    case EscrowErrorCode::kUnauthorized:
      return ::grpc::StatusCode::PERMISSION_DENIED;
    case EscrowErrorCode::kExceedsBudget:
      return ::grpc::StatusCode::OUT_OF_RANGE;
    case EscrowErrorCode::kAlreadyPaid:
      return ::grpc::StatusCode::ALREADY_EXISTS;
    case EscrowErrorCode::kTransferFailed:
    case EscrowErrorCode::kReentrantCall:
      return ::grpc::StatusCode::ABORTED;
  }
  return ::grpc::StatusCode::INTERNAL;
}

::grpc::Status ToStatus(const std::exception& e) {
  if (const auto* escrow_error = dynamic_cast<const util::EscrowError*>(&e)) {
    return {ToStatusCode(escrow_error->code()), std::string(util::ToString(escrow_error->code())) + ": " + e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

} // namespace escrow::grpc
