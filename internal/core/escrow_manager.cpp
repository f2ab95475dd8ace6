#include "escrow_manager.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/address.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace escrow::core {

using namespace escrow::ledger::core::v1;

namespace {

std::string TaskLabel(uint64_t task_id) {
  return "task " + std::to_string(task_id);
}

std::string StatusLabel(TaskStatus status) {
  return TaskStatus_Name(status);
}

Task ToProto(const db::model::TaskRecord& record) {
  Task task;
  task.set_id(record.id);
  task.set_client(record.client);
  task.set_total_amount(record.total_amount);
  task.set_released_amount(record.released_amount);
  task.set_status(record.status);
  *task.mutable_created_at() = util::MillisToTimestamp(record.created_at_ms);
  return task;
}

LedgerEvent ToProto(const db::model::EventRecord& record) {
  LedgerEvent event;
  event.set_sequence(record.sequence);
  event.set_type(record.type);
  event.set_task_id(record.task_id);
  event.set_subtask_index(record.subtask_index);
  event.set_actor(record.actor);
  event.set_counterparty(record.counterparty);
  event.set_amount(record.amount);
  event.set_fee(record.fee);
  event.set_fee_recipient(record.fee_recipient);
  event.set_refund(record.refund);
  event.set_fee_bps(record.fee_bps);
  *event.mutable_emitted_at() = util::MillisToTimestamp(record.emitted_at_ms);
  return event;
}

FeePolicy ToProto(const db::model::FeePolicyRecord& record) {
  FeePolicy policy;
  policy.set_platform_fee_bps(record.platform_fee_bps);
  policy.set_fee_recipient(record.fee_recipient);
  return policy;
}

db::model::EventRecord NewEvent(LedgerEventType type, uint64_t task_id, const std::string& actor) {
  db::model::EventRecord record;
  record.type          = type;
  record.task_id       = task_id;
  record.actor         = actor;
  record.emitted_at_ms = util::NowMillis();
  return record;
}

// Zero-value moves are skipped.
void Credit(asset::AssetTransaction& transfer, const std::string& recipient, uint64_t amount, const std::string& context) {
  if (amount == 0) {
    return;
  }
  if (!transfer.CreditTo(recipient, amount)) {
    throw util::TransferFailed(context + ": transfer of " + std::to_string(amount) + " to '" + recipient + "' failed");
  }
}

void Transition(db::model::TaskRecord& task, TaskStatus to) {
  if (!model::CanTransition(task.status, to)) {
    throw util::InvalidStatus(TaskLabel(task.id) + " cannot move from " + StatusLabel(task.status) + " to " + StatusLabel(to));
  }
  task.status = to;
}

} // namespace

EscrowManager::EscrowManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<asset::AssetLedger> assets)
    : repository_(std::move(repository)), assets_(std::move(assets)), access_(repository_), fees_(repository_) {
  if (!assets_) {
    throw std::invalid_argument("EscrowManager requires an asset ledger");
  }
}

void EscrowManager::Initialize(const std::string& initial_admin, uint32_t platform_fee_bps, const std::string& fee_recipient) {
  ReentrancyGuard::Scope scope(guard_, "Initialize");

  fee::FeePolicy::ValidateRate(platform_fee_bps);
  RequireParty(fee_recipient, "fee recipient");

  auto tx           = repository_->Begin();
  bool seeded_admin = access_.Bootstrap(*tx, initial_admin);
  bool seeded_fee   = fees_.Bootstrap(*tx, platform_fee_bps, fee_recipient);
  tx->Commit();

  if (seeded_admin) {
    ESCROW_LOG_INFO("seeded admin set", {observability::StringField("admin", initial_admin)});
  }
  if (seeded_fee) {
    ESCROW_LOG_INFO("seeded fee policy", {observability::IntField("platform_fee_bps", platform_fee_bps),
                                          observability::StringField("fee_recipient", fee_recipient)});
  }
}

void EscrowManager::RequireParty(const std::string& account, const char* role) const {
  if (!util::IsValidAddress(account)) {
    throw util::InvalidAddress(std::string(role) + " '" + account + "' is not a valid address");
  }
  if (account == assets_->CustodyAccount()) {
    throw util::InvalidAddress(std::string(role) + " '" + account + "' is the escrow custody account");
  }
}

db::model::TaskRecord EscrowManager::LoadTask(db::Transaction& tx, uint64_t task_id) {
  std::optional<db::model::TaskRecord> task;
  if (task_id != 0) {
    task = repository_->GetTask(tx, task_id);
  }
  if (!task) {
    throw util::TaskNotFound(TaskLabel(task_id) + " does not exist");
  }
  return *task;
}

LedgerEvent EscrowManager::Emit(db::Transaction& tx, db::model::EventRecord record) {
  db::ThrowIfError(repository_->AppendEvent(tx, record), "append event");
  return ToProto(record);
}

// ------------------------------------------------------------------
// Task lifecycle
// ------------------------------------------------------------------

TaskMutation EscrowManager::FundTask(const std::string& caller, uint64_t amount) {
  ReentrancyGuard::Scope scope(guard_, "FundTask");

  if (amount == 0) {
    throw util::InvalidAmount("deposit must be greater than zero");
  }
  RequireParty(caller, "client");

  auto tx       = repository_->Begin();
  auto transfer = assets_->Begin();

  if (!transfer->DebitFrom(caller, amount)) {
    throw util::TransferFailed("debit of " + std::to_string(amount) + " from '" + caller + "' failed");
  }

  db::model::TaskRecord task;
  task.id              = repository_->AllocateTaskId(*tx);
  task.client          = caller;
  task.total_amount    = amount;
  task.released_amount = 0;
  task.status          = TASK_STATUS_FUNDED;
  task.created_at_ms   = util::NowMillis();
  db::ThrowIfError(repository_->InsertTask(*tx, task), "insert " + TaskLabel(task.id));

  auto record   = NewEvent(LEDGER_EVENT_TYPE_TASK_FUNDED, task.id, caller);
  record.amount = amount;
  auto event    = Emit(*tx, std::move(record));

  tx->Commit();
  transfer->Commit();
  return {ToProto(task), std::move(event)};
}

TaskMutation EscrowManager::ApproveSubtask(const std::string& caller, uint64_t task_id, uint64_t subtask_index,
                                           const std::string& worker, uint64_t amount) {
  ReentrancyGuard::Scope scope(guard_, "ApproveSubtask");

  auto tx   = repository_->Begin();
  auto task = LoadTask(*tx, task_id);

  if (task.status != TASK_STATUS_FUNDED && task.status != TASK_STATUS_IN_PROGRESS) {
    throw util::InvalidStatus(TaskLabel(task_id) + " is " + StatusLabel(task.status) + "; approvals need FUNDED or IN_PROGRESS");
  }
  access_.RequireClientOrAdmin(*tx, caller, task, "ApproveSubtask");
  RequireParty(worker, "worker");
  if (amount == 0) {
    throw util::InvalidAmount("subtask amount must be greater than zero");
  }
  if (amount > task.Remaining()) {
    throw util::ExceedsBudget(TaskLabel(task_id) + " has " + std::to_string(task.Remaining()) + " unreleased; cannot release " +
                              std::to_string(amount));
  }
  auto existing = repository_->GetSubtaskPayment(*tx, task_id, subtask_index);
  if (existing && existing->paid) {
    throw util::AlreadyPaid("subtask " + std::to_string(subtask_index) + " of " + TaskLabel(task_id) + " is already paid");
  }

  const auto policy = fees_.Current(*tx);
  const auto split  = fee::FeePolicy::Split(amount, policy.platform_fee_bps);

  // ledger first: the paid flag is recorded before any value moves
  db::ThrowIfError(repository_->InsertSubtaskPayment(*tx, {task_id, subtask_index, worker, amount, true}), "record subtask payment");
  task.released_amount += amount;
  Transition(task, TASK_STATUS_IN_PROGRESS);
  db::ThrowIfError(repository_->UpdateTask(*tx, task), "update " + TaskLabel(task_id));

  auto transfer = assets_->Begin();
  Credit(*transfer, worker, split.worker_amount, "ApproveSubtask");
  Credit(*transfer, policy.fee_recipient, split.fee, "ApproveSubtask fee");

  auto record          = NewEvent(LEDGER_EVENT_TYPE_SUBTASK_APPROVED, task_id, caller);
  record.subtask_index = subtask_index;
  record.counterparty  = worker;
  record.amount        = amount;
  record.fee           = split.fee;
  record.fee_recipient = policy.fee_recipient;
  record.fee_bps       = policy.platform_fee_bps;
  auto event           = Emit(*tx, std::move(record));

  tx->Commit();
  transfer->Commit();
  return {ToProto(task), std::move(event)};
}

TaskMutation EscrowManager::CompleteTask(const std::string& caller, uint64_t task_id) {
  ReentrancyGuard::Scope scope(guard_, "CompleteTask");

  auto tx   = repository_->Begin();
  auto task = LoadTask(*tx, task_id);

  if (task.status != TASK_STATUS_IN_PROGRESS) {
    throw util::InvalidStatus(TaskLabel(task_id) + " is " + StatusLabel(task.status) + "; completion needs IN_PROGRESS");
  }
  access_.RequireClientOrAdmin(*tx, caller, task, "CompleteTask");

  const uint64_t refund = task.Remaining();
  Transition(task, TASK_STATUS_COMPLETED);
  db::ThrowIfError(repository_->UpdateTask(*tx, task), "update " + TaskLabel(task_id));

  auto transfer = assets_->Begin();
  Credit(*transfer, task.client, refund, "CompleteTask refund");

  auto record         = NewEvent(LEDGER_EVENT_TYPE_TASK_COMPLETED, task_id, caller);
  record.counterparty = task.client;
  record.refund       = refund;
  auto event          = Emit(*tx, std::move(record));

  tx->Commit();
  transfer->Commit();
  return {ToProto(task), std::move(event)};
}

TaskMutation EscrowManager::RaiseDispute(const std::string& caller, uint64_t task_id) {
  ReentrancyGuard::Scope scope(guard_, "RaiseDispute");

  auto tx   = repository_->Begin();
  auto task = LoadTask(*tx, task_id);

  if (task.status != TASK_STATUS_FUNDED && task.status != TASK_STATUS_IN_PROGRESS) {
    throw util::InvalidStatus(TaskLabel(task_id) + " is " + StatusLabel(task.status) + "; disputes need FUNDED or IN_PROGRESS");
  }

  Transition(task, TASK_STATUS_DISPUTED);
  db::ThrowIfError(repository_->UpdateTask(*tx, task), "update " + TaskLabel(task_id));

  auto event = Emit(*tx, NewEvent(LEDGER_EVENT_TYPE_DISPUTE_RAISED, task_id, caller));

  tx->Commit();
  return {ToProto(task), std::move(event)};
}

TaskMutation EscrowManager::ResolveDispute(const std::string& caller, uint64_t task_id, const std::string& winner,
                                           uint64_t winner_amount) {
  ReentrancyGuard::Scope scope(guard_, "ResolveDispute");

  auto tx = repository_->Begin();
  access_.RequireAdmin(*tx, caller, "ResolveDispute");

  std::optional<db::model::TaskRecord> found;
  if (task_id != 0) {
    found = repository_->GetTask(*tx, task_id);
  }
  if (!found || found->status != TASK_STATUS_DISPUTED) {
    throw util::InvalidStatus(TaskLabel(task_id) + " is not DISPUTED");
  }
  auto task = *found;

  if (winner_amount > task.Remaining()) {
    throw util::ExceedsBudget(TaskLabel(task_id) + " has " + std::to_string(task.Remaining()) + " unreleased; cannot award " +
                              std::to_string(winner_amount));
  }
  if (winner_amount > 0) {
    RequireParty(winner, "winner");
  }

  const uint64_t refund = task.Remaining() - winner_amount;
  task.released_amount += winner_amount;
  Transition(task, TASK_STATUS_RESOLVED);
  db::ThrowIfError(repository_->UpdateTask(*tx, task), "update " + TaskLabel(task_id));

  auto transfer = assets_->Begin();
  Credit(*transfer, winner, winner_amount, "ResolveDispute award");
  Credit(*transfer, task.client, refund, "ResolveDispute refund");

  auto record         = NewEvent(LEDGER_EVENT_TYPE_DISPUTE_RESOLVED, task_id, caller);
  record.counterparty = winner;
  record.amount       = winner_amount;
  record.refund       = refund;
  auto event          = Emit(*tx, std::move(record));

  tx->Commit();
  transfer->Commit();
  return {ToProto(task), std::move(event)};
}

TaskMutation EscrowManager::CancelTask(const std::string& caller, uint64_t task_id) {
  ReentrancyGuard::Scope scope(guard_, "CancelTask");

  auto tx   = repository_->Begin();
  auto task = LoadTask(*tx, task_id);

  if (model::IsTerminal(task.status)) {
    throw util::InvalidStatus(TaskLabel(task_id) + " is already " + StatusLabel(task.status));
  }
  if (task.status != TASK_STATUS_FUNDED || task.released_amount != 0) {
    throw util::WorkAlreadyStarted(TaskLabel(task_id) + " is " + StatusLabel(task.status) + " with " +
                                   std::to_string(task.released_amount) + " released");
  }
  access_.RequireClientOrAdmin(*tx, caller, task, "CancelTask");

  const uint64_t refund = task.total_amount;
  Transition(task, TASK_STATUS_CANCELLED);
  db::ThrowIfError(repository_->UpdateTask(*tx, task), "update " + TaskLabel(task_id));

  auto transfer = assets_->Begin();
  Credit(*transfer, task.client, refund, "CancelTask refund");

  auto record         = NewEvent(LEDGER_EVENT_TYPE_TASK_CANCELLED, task_id, caller);
  record.counterparty = task.client;
  record.refund       = refund;
  auto event          = Emit(*tx, std::move(record));

  tx->Commit();
  transfer->Commit();
  return {ToProto(task), std::move(event)};
}

// ------------------------------------------------------------------
// Administration
// ------------------------------------------------------------------

FeePolicyChange EscrowManager::SetFee(const std::string& caller, uint32_t platform_fee_bps) {
  ReentrancyGuard::Scope scope(guard_, "SetFee");

  auto tx = repository_->Begin();
  access_.RequireAdmin(*tx, caller, "SetFee");
  auto policy = fees_.SetRate(*tx, platform_fee_bps);

  auto record    = NewEvent(LEDGER_EVENT_TYPE_FEE_UPDATED, 0, caller);
  record.fee_bps = policy.platform_fee_bps;
  auto event     = Emit(*tx, std::move(record));

  tx->Commit();
  return {ToProto(policy), std::move(event)};
}

FeePolicyChange EscrowManager::SetFeeRecipient(const std::string& caller, const std::string& fee_recipient) {
  ReentrancyGuard::Scope scope(guard_, "SetFeeRecipient");

  auto tx = repository_->Begin();
  access_.RequireAdmin(*tx, caller, "SetFeeRecipient");
  RequireParty(fee_recipient, "fee recipient");
  auto policy = fees_.SetRecipient(*tx, fee_recipient);

  auto record          = NewEvent(LEDGER_EVENT_TYPE_FEE_RECIPIENT_UPDATED, 0, caller);
  record.fee_recipient = policy.fee_recipient;
  auto event           = Emit(*tx, std::move(record));

  tx->Commit();
  return {ToProto(policy), std::move(event)};
}

std::optional<LedgerEvent> EscrowManager::GrantAdmin(const std::string& caller, const std::string& account) {
  ReentrancyGuard::Scope scope(guard_, "GrantAdmin");

  auto tx = repository_->Begin();
  access_.RequireAdmin(*tx, caller, "GrantAdmin");
  if (!access_.Grant(*tx, account)) {
    return std::nullopt;
  }

  auto record         = NewEvent(LEDGER_EVENT_TYPE_ADMIN_GRANTED, 0, caller);
  record.counterparty = account;
  auto event          = Emit(*tx, std::move(record));

  tx->Commit();
  return event;
}

std::optional<LedgerEvent> EscrowManager::RevokeAdmin(const std::string& caller, const std::string& account) {
  ReentrancyGuard::Scope scope(guard_, "RevokeAdmin");

  auto tx = repository_->Begin();
  access_.RequireAdmin(*tx, caller, "RevokeAdmin");
  if (!access_.Revoke(*tx, account)) {
    return std::nullopt;
  }

  auto record         = NewEvent(LEDGER_EVENT_TYPE_ADMIN_REVOKED, 0, caller);
  record.counterparty = account;
  auto event          = Emit(*tx, std::move(record));

  tx->Commit();
  return event;
}

// ------------------------------------------------------------------
// Queries
// ------------------------------------------------------------------

Task EscrowManager::GetTask(uint64_t task_id) {
  auto tx   = repository_->Begin();
  auto task = LoadTask(*tx, task_id);
  tx->Commit();
  return ToProto(task);
}

SubtaskPayment EscrowManager::GetSubtaskPayment(uint64_t task_id, uint64_t subtask_index) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetSubtaskPayment(*tx, task_id, subtask_index);
  tx->Commit();

  SubtaskPayment payment;
  payment.set_task_id(task_id);
  payment.set_subtask_index(subtask_index);
  if (record) {
    payment.set_worker(record->worker);
    payment.set_amount(record->amount);
    payment.set_paid(record->paid);
  }
  return payment;
}

FeePolicy EscrowManager::GetFeePolicy() {
  auto tx     = repository_->Begin();
  auto policy = fees_.Current(*tx);
  tx->Commit();
  return ToProto(policy);
}

bool EscrowManager::IsAdmin(const std::string& account) {
  auto tx       = repository_->Begin();
  bool is_admin = access_.IsAdmin(*tx, account);
  tx->Commit();
  return is_admin;
}

uint64_t EscrowManager::TaskCounter() {
  auto tx      = repository_->Begin();
  auto counter = repository_->GetTaskCounter(*tx);
  tx->Commit();
  return counter;
}

uint64_t EscrowManager::BalanceOf(const std::string& account) {
  return assets_->BalanceOf(account);
}

std::vector<LedgerEvent> EscrowManager::ListEvents(uint64_t after_sequence, uint64_t max_events) {
  if (max_events == 0) {
    max_events = kDefaultEventPage;
  }
  max_events = std::min(max_events, kMaxEventPage);

  auto tx      = repository_->Begin();
  auto records = repository_->ReadEvents(*tx, after_sequence, max_events);
  tx->Commit();

  std::vector<LedgerEvent> events;
  events.reserve(records.size());
  for (const auto& record : records) {
    events.push_back(ToProto(record));
  }
  return events;
}

uint64_t EscrowManager::LastEventSequence() {
  auto tx   = repository_->Begin();
  auto last = repository_->GetLastEventSequence(*tx);
  tx->Commit();
  return last;
}

LedgerStats EscrowManager::Stats() {
  LedgerStats stats;

  auto tx            = repository_->Begin();
  stats.task_counter = repository_->GetTaskCounter(*tx);
  stats.event_count  = repository_->GetLastEventSequence(*tx);
  for (const auto& task : repository_->ListTasks(*tx)) {
    switch (task.status) {
      case TASK_STATUS_FUNDED:
        ++stats.tasks_funded;
        break;
      case TASK_STATUS_IN_PROGRESS:
        ++stats.tasks_in_progress;
        break;
      case TASK_STATUS_COMPLETED:
        ++stats.tasks_completed;
        break;
      case TASK_STATUS_DISPUTED:
        ++stats.tasks_disputed;
        break;
      case TASK_STATUS_CANCELLED:
        ++stats.tasks_cancelled;
        break;
      case TASK_STATUS_RESOLVED:
        ++stats.tasks_resolved;
        break;
      default:
        break;
    }
    if (model::IsOpen(task.status)) {
      stats.value_locked += task.Remaining();
    }
  }
  tx->Commit();

  stats.custody_balance = assets_->BalanceOf(assets_->CustodyAccount());
  return stats;
}

} // namespace escrow::core
