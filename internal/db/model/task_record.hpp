#pragma once

#include <cstdint>
#include <string>

#include "escrow/ledger/core/v1/types.pb.h"

namespace escrow::db::model {

/*
  Persistent task row.

  IMPORTANT:
  - This is the authoritative state machine record.
  - client and total_amount never change after insert.
  - released_amount only grows and never exceeds total_amount.
*/

struct TaskRecord {
  uint64_t id = 0; // 0 is reserved for "not found"

  std::string client;

  uint64_t total_amount    = 0;
  uint64_t released_amount = 0;

  escrow::ledger::core::v1::TaskStatus status = escrow::ledger::core::v1::TASK_STATUS_UNSPECIFIED;

  uint64_t created_at_ms = 0;

  uint64_t Remaining() const {
    return total_amount - released_amount;
  }
};

} // namespace escrow::db::model
