#pragma once

#include "escrow/ledger/core/v1/types.pb.h"

namespace escrow::model {

using ::escrow::ledger::core::v1::TaskStatus;

/*
  Task lifecycle:

    FUNDED ------approve------> IN_PROGRESS --approve--> IN_PROGRESS
    FUNDED ------cancel-------> CANCELLED
    FUNDED ------dispute------> DISPUTED
    IN_PROGRESS --complete----> COMPLETED
    IN_PROGRESS --dispute-----> DISPUTED
    DISPUTED ----resolve------> RESOLVED

  There are no implicit transitions and nothing leaves a terminal state.
*/

constexpr bool IsTerminal(TaskStatus status) {
  return status == ::escrow::ledger::core::v1::TASK_STATUS_COMPLETED || status == ::escrow::ledger::core::v1::TASK_STATUS_CANCELLED ||
         status == ::escrow::ledger::core::v1::TASK_STATUS_RESOLVED;
}

// True while the task still holds unreleased funds that may move.
constexpr bool IsOpen(TaskStatus status) {
  return status == ::escrow::ledger::core::v1::TASK_STATUS_FUNDED || status == ::escrow::ledger::core::v1::TASK_STATUS_IN_PROGRESS ||
         status == ::escrow::ledger::core::v1::TASK_STATUS_DISPUTED;
}

constexpr bool CanTransition(TaskStatus from, TaskStatus to) {
  using namespace ::escrow::ledger::core::v1;

  switch (from) {
    case TASK_STATUS_FUNDED:
      return to == TASK_STATUS_IN_PROGRESS || to == TASK_STATUS_CANCELLED || to == TASK_STATUS_DISPUTED;
    case TASK_STATUS_IN_PROGRESS:
      return to == TASK_STATUS_IN_PROGRESS || to == TASK_STATUS_COMPLETED || to == TASK_STATUS_DISPUTED;
    case TASK_STATUS_DISPUTED:
      return to == TASK_STATUS_RESOLVED;
    default:
      return false;
  }
}

} // namespace escrow::model
