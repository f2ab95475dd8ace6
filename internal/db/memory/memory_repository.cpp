#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace escrow::db::memory {

MemoryRepository::MemoryRepository() : committed_(std::make_shared<const State>()) {}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

uint64_t MemoryRepository::AllocateTaskId(Transaction& t) {
  return ++TX(t).Mutable().task_counter;
}

uint64_t MemoryRepository::GetTaskCounter(Transaction& t) {
  return TX(t).View().task_counter;
}

Result MemoryRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
  if (r.id == 0) return Result::Err(ErrorCode::ConstraintViolation, "task id 0 is reserved");
  if (TX(t).View().tasks.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  TX(t).Mutable().tasks[r.id] = r;
  return Result::Ok();
}

std::optional<model::TaskRecord> MemoryRepository::GetTask(Transaction& t, uint64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.tasks.find(id);
  if (it == s.tasks.end()) return std::nullopt;
  return it->second;
}

std::vector<model::TaskRecord> MemoryRepository::ListTasks(Transaction& t) {
  const auto&                    s = TX(t).View();
  std::vector<model::TaskRecord> records;
  records.reserve(s.tasks.size());
  for (const auto& [_, record] : s.tasks) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return a.id < b.id; });
  return records;
}

Result MemoryRepository::UpdateTask(Transaction& t, const model::TaskRecord& r) {
  if (!TX(t).View().tasks.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  TX(t).Mutable().tasks[r.id] = r;
  return Result::Ok();
}

Result MemoryRepository::InsertSubtaskPayment(Transaction& t, const model::SubtaskPaymentRecord& r) {
  const auto key = std::make_pair(r.task_id, r.subtask_index);
  if (TX(t).View().subtask_payments.contains(key)) return Result::Err(ErrorCode::AlreadyExists);
  TX(t).Mutable().subtask_payments[key] = r;
  return Result::Ok();
}

std::optional<model::SubtaskPaymentRecord> MemoryRepository::GetSubtaskPayment(Transaction& t, uint64_t task_id, uint64_t subtask_index) {
  const auto& s  = TX(t).View();
  auto        it = s.subtask_payments.find(std::make_pair(task_id, subtask_index));
  if (it == s.subtask_payments.end()) return std::nullopt;
  return it->second;
}

std::vector<model::SubtaskPaymentRecord> MemoryRepository::ListSubtaskPayments(Transaction& t, uint64_t task_id) {
  const auto&                              s = TX(t).View();
  std::vector<model::SubtaskPaymentRecord> out;
  auto it = s.subtask_payments.lower_bound(std::make_pair(task_id, uint64_t{0}));
  for (; it != s.subtask_payments.end() && it->first.first == task_id; ++it) {
    out.push_back(it->second);
  }
  return out;
}

std::optional<model::FeePolicyRecord> MemoryRepository::GetFeePolicy(Transaction& t) {
  return TX(t).View().fee_policy;
}

Result MemoryRepository::PutFeePolicy(Transaction& t, const model::FeePolicyRecord& r) {
  TX(t).Mutable().fee_policy = r;
  return Result::Ok();
}

Result MemoryRepository::InsertAdmin(Transaction& t, const std::string& account) {
  if (TX(t).View().admins.contains(account)) return Result::Err(ErrorCode::AlreadyExists);
  TX(t).Mutable().admins.insert(account);
  return Result::Ok();
}

Result MemoryRepository::DeleteAdmin(Transaction& t, const std::string& account) {
  if (!TX(t).View().admins.contains(account)) return Result::Err(ErrorCode::NotFound);
  TX(t).Mutable().admins.erase(account);
  return Result::Ok();
}

bool MemoryRepository::IsAdmin(Transaction& t, const std::string& account) {
  return TX(t).View().admins.contains(account);
}

std::vector<std::string> MemoryRepository::ListAdmins(Transaction& t) {
  const auto& admins = TX(t).View().admins;
  return {admins.begin(), admins.end()};
}

Result MemoryRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
  auto& s    = TX(t).Mutable();
  r.sequence = s.events.size() + 1;
  s.events.push_back(r);
  return Result::Ok();
}

std::vector<model::EventRecord> MemoryRepository::ReadEvents(Transaction& t, uint64_t after_sequence, uint64_t max_events) {
  const auto&                     events = TX(t).View().events;
  std::vector<model::EventRecord> out;
  // sequence N lives at index N - 1
  for (uint64_t i = after_sequence; i < events.size() && out.size() < max_events; ++i) {
    out.push_back(events[i]);
  }
  return out;
}

uint64_t MemoryRepository::GetLastEventSequence(Transaction& t) {
  return TX(t).View().events.size();
}

} // namespace escrow::db::memory
