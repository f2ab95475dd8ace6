#pragma once

#include <grpcpp/grpcpp.h>
#include "internal/util/errors.hpp"

namespace escrow::grpc {

/*
  Converts internal exceptions into gRPC status codes.

  Ledger rejections carry their taxonomy name as the message prefix
  ("EXCEEDS_BUDGET: ...") so clients can recover the exact error.
*/

::grpc::StatusCode ToStatusCode(util::EscrowErrorCode code);

::grpc::Status ToStatus(const std::exception& e);

} // namespace escrow::grpc
