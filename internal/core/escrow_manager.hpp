#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "escrow/ledger/core/v1/events.pb.h"
#include "escrow/ledger/core/v1/types.pb.h"
#include "internal/access/access_control.hpp"
#include "internal/asset/asset_ledger.hpp"
#include "internal/core/reentrancy_guard.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/fee/fee_policy.hpp"

namespace escrow::core {

struct TaskMutation {
  escrow::ledger::core::v1::Task        task;
  escrow::ledger::core::v1::LedgerEvent event;
};

struct FeePolicyChange {
  escrow::ledger::core::v1::FeePolicy   policy;
  escrow::ledger::core::v1::LedgerEvent event;
};

struct LedgerStats {
  uint64_t task_counter      = 0;
  uint64_t tasks_funded      = 0;
  uint64_t tasks_in_progress = 0;
  uint64_t tasks_completed   = 0;
  uint64_t tasks_disputed    = 0;
  uint64_t tasks_cancelled   = 0;
  uint64_t tasks_resolved    = 0;
  uint64_t value_locked      = 0;
  uint64_t custody_balance   = 0;
  uint64_t event_count       = 0;
};

/*
  Escrow state machine.

  Every mutating call runs as one unit under the reentrancy guard:

    validate → ledger mutation → asset transfers → event → commit

  The ledger transaction and the asset transaction commit together. Any
  exception, including a refused transfer, unwinds both so balances, task
  rows, subtask rows and the event log are left exactly as they were.

  Rejections throw the util::EscrowError subclass for the failing check.
*/
class EscrowManager {
 public:
  static constexpr uint64_t kDefaultEventPage = 100;
  static constexpr uint64_t kMaxEventPage     = 1000;

  EscrowManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<asset::AssetLedger> assets);

  // Seeds admin set and fee policy on an empty ledger; validates the rate always.
  void Initialize(const std::string& initial_admin, uint32_t platform_fee_bps, const std::string& fee_recipient);

  // ------------------------------------------------------------------
  // Task lifecycle
  // ------------------------------------------------------------------
  TaskMutation FundTask(const std::string& caller, uint64_t amount);
  TaskMutation ApproveSubtask(const std::string& caller, uint64_t task_id, uint64_t subtask_index, const std::string& worker,
                              uint64_t amount);
  TaskMutation CompleteTask(const std::string& caller, uint64_t task_id);
  TaskMutation RaiseDispute(const std::string& caller, uint64_t task_id);
  TaskMutation ResolveDispute(const std::string& caller, uint64_t task_id, const std::string& winner, uint64_t winner_amount);
  TaskMutation CancelTask(const std::string& caller, uint64_t task_id);

  // ------------------------------------------------------------------
  // Administration
  // ------------------------------------------------------------------
  FeePolicyChange SetFee(const std::string& caller, uint32_t platform_fee_bps);
  FeePolicyChange SetFeeRecipient(const std::string& caller, const std::string& fee_recipient);

  // Empty when membership did not change.
  std::optional<escrow::ledger::core::v1::LedgerEvent> GrantAdmin(const std::string& caller, const std::string& account);
  std::optional<escrow::ledger::core::v1::LedgerEvent> RevokeAdmin(const std::string& caller, const std::string& account);

  // ------------------------------------------------------------------
  // Queries (never take the guard)
  // ------------------------------------------------------------------
  escrow::ledger::core::v1::Task           GetTask(uint64_t task_id);
  escrow::ledger::core::v1::SubtaskPayment GetSubtaskPayment(uint64_t task_id, uint64_t subtask_index);
  escrow::ledger::core::v1::FeePolicy      GetFeePolicy();
  bool                                     IsAdmin(const std::string& account);
  uint64_t                                 TaskCounter();
  uint64_t                                 BalanceOf(const std::string& account);

  std::vector<escrow::ledger::core::v1::LedgerEvent> ListEvents(uint64_t after_sequence, uint64_t max_events);
  uint64_t                                           LastEventSequence();

  LedgerStats Stats();

 private:
  db::model::TaskRecord LoadTask(db::Transaction& tx, uint64_t task_id);

  // A party must be a valid address other than the custody account, which
  // only ever holds locked value. Throws util::InvalidAddress.
  void RequireParty(const std::string& account, const char* role) const;

  escrow::ledger::core::v1::LedgerEvent Emit(db::Transaction& tx, db::model::EventRecord record);

  std::shared_ptr<db::Repository>    repository_;
  std::shared_ptr<asset::AssetLedger> assets_;
  access::AccessControl              access_;
  fee::FeePolicy                     fees_;
  ReentrancyGuard                    guard_;
};

} // namespace escrow::core
