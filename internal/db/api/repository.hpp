#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/fee_policy_record.hpp"
#include "internal/db/model/subtask_payment_record.hpp"
#include "internal/db/model/task_record.hpp"

namespace escrow::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - Task id allocation and event sequencing are atomic with the transaction
  - Escrow conservation depends on this behavior

  The DB is the source of truth for:
    tasks and subtask payments
    fee policy
    admin membership
    the audit event log
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Tasks
  // ---------------------------------------------------------------------

  // Increments and returns the task counter. Ids are never reused.
  virtual uint64_t AllocateTaskId(Transaction&) = 0;

  virtual uint64_t GetTaskCounter(Transaction&) = 0;

  virtual Result InsertTask(Transaction&, const model::TaskRecord&) = 0;

  virtual std::optional<model::TaskRecord> GetTask(Transaction&, uint64_t id) = 0;

  virtual std::vector<model::TaskRecord> ListTasks(Transaction&) = 0;

  virtual Result UpdateTask(Transaction&, const model::TaskRecord&) = 0;

  // ---------------------------------------------------------------------
  // Subtask payments
  // ---------------------------------------------------------------------

  virtual Result InsertSubtaskPayment(Transaction&, const model::SubtaskPaymentRecord&) = 0;

  virtual std::optional<model::SubtaskPaymentRecord> GetSubtaskPayment(Transaction&, uint64_t task_id, uint64_t subtask_index) = 0;

  virtual std::vector<model::SubtaskPaymentRecord> ListSubtaskPayments(Transaction&, uint64_t task_id) = 0;

  // ---------------------------------------------------------------------
  // Fee policy (single row)
  // ---------------------------------------------------------------------

  virtual std::optional<model::FeePolicyRecord> GetFeePolicy(Transaction&) = 0;

  virtual Result PutFeePolicy(Transaction&, const model::FeePolicyRecord&) = 0;

  // ---------------------------------------------------------------------
  // Admin membership
  // ---------------------------------------------------------------------

  virtual Result InsertAdmin(Transaction&, const std::string& account) = 0;

  virtual Result DeleteAdmin(Transaction&, const std::string& account) = 0;

  virtual bool IsAdmin(Transaction&, const std::string& account) = 0;

  virtual std::vector<std::string> ListAdmins(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Audit events
  // ---------------------------------------------------------------------

  // Assigns record.sequence.
  virtual Result AppendEvent(Transaction&, model::EventRecord& record) = 0;

  virtual std::vector<model::EventRecord> ReadEvents(Transaction&, uint64_t after_sequence, uint64_t max_events) = 0;

  virtual uint64_t GetLastEventSequence(Transaction&) = 0;
};

} // namespace escrow::db
