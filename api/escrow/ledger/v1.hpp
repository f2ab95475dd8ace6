#pragma once

#include "escrow/ledger/core/v1/events.pb.h"
#include "escrow/ledger/core/v1/types.pb.h"

#include "escrow/ledger/services/v1/escrow_admin_service.pb.h"
#include "escrow/ledger/services/v1/escrow_service.pb.h"

#include "escrow/ledger/services/v1/escrow_admin_service.grpc.pb.h"
#include "escrow/ledger/services/v1/escrow_service.grpc.pb.h"

namespace escrow::ledger::v1 {
using namespace ::escrow::ledger::core::v1;
using namespace ::escrow::ledger::services::v1;
}
