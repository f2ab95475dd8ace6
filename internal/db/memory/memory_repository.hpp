#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace escrow::db::memory {

class MemoryTransaction;

/*
  In-process ledger store.

  Committed state is an immutable snapshot shared by every transaction
  that began after it was published, so a read-only transaction costs one
  shared_ptr copy. The first write in a transaction copies the whole
  snapshot (event log included), which makes each mutating call
  O(total state). Commit publishes the copy as the next snapshot.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<uint64_t, model::TaskRecord> tasks;
    std::map<std::pair<uint64_t, uint64_t>, model::SubtaskPaymentRecord> subtask_payments;
    std::optional<model::FeePolicyRecord> fee_policy;
    std::set<std::string> admins;
    std::vector<model::EventRecord> events;
    uint64_t task_counter = 0;
  };

  std::mutex mutex_;
  std::shared_ptr<const State> committed_;
  uint64_t committed_version_ = 0;
};

} // namespace escrow::db::memory
