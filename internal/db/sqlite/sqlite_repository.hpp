#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace escrow::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates tables and seeds counters. Idempotent.
  static void BootstrapSchema(SqliteDB& db);

  std::unique_ptr<Transaction> Begin() override;

  uint64_t AllocateTaskId(Transaction&) override;
  uint64_t GetTaskCounter(Transaction&) override;
  Result InsertTask(Transaction&, const model::TaskRecord&) override;
  std::optional<model::TaskRecord> GetTask(Transaction&, uint64_t id) override;
  std::vector<model::TaskRecord> ListTasks(Transaction&) override;
  Result UpdateTask(Transaction&, const model::TaskRecord&) override;

  Result InsertSubtaskPayment(Transaction&, const model::SubtaskPaymentRecord&) override;
  std::optional<model::SubtaskPaymentRecord> GetSubtaskPayment(
      Transaction&, uint64_t task_id, uint64_t subtask_index) override;
  std::vector<model::SubtaskPaymentRecord> ListSubtaskPayments(Transaction&, uint64_t task_id) override;

  std::optional<model::FeePolicyRecord> GetFeePolicy(Transaction&) override;
  Result PutFeePolicy(Transaction&, const model::FeePolicyRecord&) override;

  Result InsertAdmin(Transaction&, const std::string& account) override;
  Result DeleteAdmin(Transaction&, const std::string& account) override;
  bool IsAdmin(Transaction&, const std::string& account) override;
  std::vector<std::string> ListAdmins(Transaction&) override;

  Result AppendEvent(Transaction&, model::EventRecord& record) override;
  std::vector<model::EventRecord> ReadEvents(Transaction&, uint64_t after_sequence,
                                             uint64_t max_events) override;
  uint64_t GetLastEventSequence(Transaction&) override;

private:
  static SqliteTransaction& TX(Transaction&);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace escrow::db::sqlite
