#include <cassert>
#include <iostream>

#include "internal/model/state_machine.hpp"

namespace {

using namespace escrow::ledger::core::v1;
using escrow::model::CanTransition;
using escrow::model::IsOpen;
using escrow::model::IsTerminal;

constexpr TaskStatus kAll[] = {TASK_STATUS_UNSPECIFIED, TASK_STATUS_FUNDED,    TASK_STATUS_IN_PROGRESS, TASK_STATUS_COMPLETED,
                               TASK_STATUS_DISPUTED,    TASK_STATUS_CANCELLED, TASK_STATUS_RESOLVED};

static_assert(CanTransition(TASK_STATUS_FUNDED, TASK_STATUS_IN_PROGRESS));
static_assert(!CanTransition(TASK_STATUS_DISPUTED, TASK_STATUS_CANCELLED));

void TestLegalTransitions() {
  assert(CanTransition(TASK_STATUS_FUNDED, TASK_STATUS_IN_PROGRESS));
  assert(CanTransition(TASK_STATUS_FUNDED, TASK_STATUS_CANCELLED));
  assert(CanTransition(TASK_STATUS_FUNDED, TASK_STATUS_DISPUTED));
  assert(CanTransition(TASK_STATUS_IN_PROGRESS, TASK_STATUS_IN_PROGRESS));
  assert(CanTransition(TASK_STATUS_IN_PROGRESS, TASK_STATUS_COMPLETED));
  assert(CanTransition(TASK_STATUS_IN_PROGRESS, TASK_STATUS_DISPUTED));
  assert(CanTransition(TASK_STATUS_DISPUTED, TASK_STATUS_RESOLVED));
}

void TestIllegalTransitions() {
  assert(!CanTransition(TASK_STATUS_FUNDED, TASK_STATUS_COMPLETED));
  assert(!CanTransition(TASK_STATUS_FUNDED, TASK_STATUS_RESOLVED));
  assert(!CanTransition(TASK_STATUS_IN_PROGRESS, TASK_STATUS_CANCELLED));
  assert(!CanTransition(TASK_STATUS_DISPUTED, TASK_STATUS_IN_PROGRESS));
  assert(!CanTransition(TASK_STATUS_DISPUTED, TASK_STATUS_DISPUTED));
}

void TestTerminalStatesAdmitNothing() {
  for (auto from : kAll) {
    if (!IsTerminal(from)) continue;
    for (auto to : kAll) {
      assert(!CanTransition(from, to));
    }
  }
  assert(IsTerminal(TASK_STATUS_COMPLETED));
  assert(IsTerminal(TASK_STATUS_CANCELLED));
  assert(IsTerminal(TASK_STATUS_RESOLVED));
  assert(!IsTerminal(TASK_STATUS_DISPUTED));
}

void TestOpenStatesHoldFunds() {
  assert(IsOpen(TASK_STATUS_FUNDED));
  assert(IsOpen(TASK_STATUS_IN_PROGRESS));
  assert(IsOpen(TASK_STATUS_DISPUTED));
  for (auto status : kAll) {
    if (IsTerminal(status)) assert(!IsOpen(status));
  }
  assert(!IsOpen(TASK_STATUS_UNSPECIFIED));
}

} // namespace

int main() {
  TestLegalTransitions();
  TestIllegalTransitions();
  TestTerminalStatesAdmitNothing();
  TestOpenStatesHoldFunds();

  std::cout << "escrow_ledger_unit_task_status: pass\n";
  return 0;
}
