#pragma once

#include <cstdint>
#include <string>

#include "escrow/ledger/core/v1/events.pb.h"

namespace escrow::db::model {

/*
  Audit log row. Sequence numbers are assigned by the repository on append,
  start at 1 and are contiguous. Rows are never updated or deleted.
*/

struct EventRecord {
  uint64_t sequence = 0;

  escrow::ledger::core::v1::LedgerEventType type = escrow::ledger::core::v1::LEDGER_EVENT_TYPE_UNSPECIFIED;

  uint64_t    task_id       = 0;
  uint64_t    subtask_index = 0;
  std::string actor;
  std::string counterparty;
  uint64_t    amount = 0;
  uint64_t    fee    = 0;
  std::string fee_recipient;
  uint64_t    refund        = 0;
  uint32_t    fee_bps       = 0;
  uint64_t    emitted_at_ms = 0;
};

} // namespace escrow::db::model
