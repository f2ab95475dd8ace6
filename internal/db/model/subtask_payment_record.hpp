#pragma once

#include <cstdint>
#include <string>

namespace escrow::db::model {

// Keyed by (task_id, subtask_index). Rows are only ever written once, as paid.
struct SubtaskPaymentRecord {
  uint64_t    task_id       = 0;
  uint64_t    subtask_index = 0;
  std::string worker;
  uint64_t    amount = 0;
  bool        paid   = false;
};

} // namespace escrow::db::model
