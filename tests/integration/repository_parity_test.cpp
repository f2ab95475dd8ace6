#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/asset/memory_asset_ledger.hpp"
#include "internal/core/escrow_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

#if ESCROW_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace {

using escrow::db::ErrorCode;
using escrow::db::Repository;
using escrow::db::memory::MemoryRepository;
using escrow::db::model::EventRecord;
using escrow::db::model::FeePolicyRecord;
using escrow::db::model::SubtaskPaymentRecord;
using escrow::db::model::TaskRecord;
using namespace escrow::ledger::core::v1;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  // false when a second Begin() on the same thread nests inside the first
  bool supports_parallel_transactions = true;
};

TaskRecord NewTask(uint64_t id, const std::string& client, uint64_t total) {
  TaskRecord task;
  task.id            = id;
  task.client        = client;
  task.total_amount  = total;
  task.status        = TASK_STATUS_FUNDED;
  task.created_at_ms = NowMs();
  return task;
}

void VerifyTaskLifecycle(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.GetTaskCounter(*tx) == 0);

  const auto id = repo.AllocateTaskId(*tx);
  assert(id == 1);
  assert(repo.AllocateTaskId(*tx) == 2);
  assert(repo.GetTaskCounter(*tx) == 2);

  auto task = NewTask(id, "client", std::numeric_limits<uint64_t>::max());
  assert(repo.InsertTask(*tx, task));
  auto duplicate = repo.InsertTask(*tx, task);
  assert(!duplicate);
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto loaded = repo.GetTask(*tx, id);
  assert(loaded.has_value());
  assert(loaded->client == "client");
  // full unsigned range survives storage
  assert(loaded->total_amount == std::numeric_limits<uint64_t>::max());
  assert(loaded->status == TASK_STATUS_FUNDED);
  assert(loaded->created_at_ms == task.created_at_ms);

  loaded->released_amount = (uint64_t{1} << 63) + 5;
  loaded->status          = TASK_STATUS_IN_PROGRESS;
  assert(repo.UpdateTask(*tx, *loaded));

  auto updated = repo.GetTask(*tx, id);
  assert(updated->released_amount == (uint64_t{1} << 63) + 5);
  assert(updated->status == TASK_STATUS_IN_PROGRESS);

  auto missing = repo.UpdateTask(*tx, NewTask(99, "nobody", 1));
  assert(missing.code == ErrorCode::NotFound);
  assert(!repo.GetTask(*tx, 99).has_value());

  assert(repo.InsertTask(*tx, NewTask(2, "other", 10)));
  auto tasks = repo.ListTasks(*tx);
  assert(tasks.size() == 2);
  assert(tasks[0].id == 1);
  assert(tasks[1].id == 2);
  tx->Commit();
}

void VerifySubtaskPayments(Repository& repo) {
  auto tx = repo.Begin();

  assert(repo.InsertSubtaskPayment(*tx, {1, 7, "worker-b", 300, true}));
  assert(repo.InsertSubtaskPayment(*tx, {1, 2, "worker-a", 200, true}));
  assert(repo.InsertSubtaskPayment(*tx, {2, 0, "worker-c", 1, true}));

  auto duplicate = repo.InsertSubtaskPayment(*tx, {1, 7, "someone", 1, true});
  assert(duplicate.code == ErrorCode::AlreadyExists);

  auto payment = repo.GetSubtaskPayment(*tx, 1, 7);
  assert(payment.has_value());
  assert(payment->worker == "worker-b");
  assert(payment->amount == 300);
  assert(payment->paid);
  assert(!repo.GetSubtaskPayment(*tx, 1, 3).has_value());

  auto listed = repo.ListSubtaskPayments(*tx, 1);
  assert(listed.size() == 2);
  assert(listed[0].subtask_index == 2);
  assert(listed[1].subtask_index == 7);
  assert(repo.ListSubtaskPayments(*tx, 3).empty());
  tx->Commit();
}

void VerifyFeePolicyAndAdmins(Repository& repo) {
  auto tx = repo.Begin();
  assert(!repo.GetFeePolicy(*tx).has_value());

  assert(repo.PutFeePolicy(*tx, FeePolicyRecord{250, "platform"}));
  assert(repo.PutFeePolicy(*tx, FeePolicyRecord{2000, "treasury"}));
  auto policy = repo.GetFeePolicy(*tx);
  assert(policy.has_value());
  assert(policy->platform_fee_bps == 2000);
  assert(policy->fee_recipient == "treasury");

  assert(repo.ListAdmins(*tx).empty());
  assert(repo.InsertAdmin(*tx, "root"));
  assert(repo.InsertAdmin(*tx, "ops"));
  assert(repo.InsertAdmin(*tx, "root").code == ErrorCode::AlreadyExists);
  assert(repo.IsAdmin(*tx, "root"));
  assert(!repo.IsAdmin(*tx, "stranger"));

  auto admins = repo.ListAdmins(*tx);
  assert(admins.size() == 2);
  assert(admins[0] == "ops");
  assert(admins[1] == "root");

  assert(repo.DeleteAdmin(*tx, "ops"));
  assert(repo.DeleteAdmin(*tx, "ops").code == ErrorCode::NotFound);
  assert(!repo.IsAdmin(*tx, "ops"));
  tx->Commit();
}

void VerifyEventLog(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.GetLastEventSequence(*tx) == 0);
  assert(repo.ReadEvents(*tx, 0, 10).empty());

  for (uint64_t i = 1; i <= 5; ++i) {
    EventRecord record;
    record.type          = LEDGER_EVENT_TYPE_SUBTASK_APPROVED;
    record.task_id       = 1;
    record.subtask_index = i;
    record.actor         = "client";
    record.counterparty  = "worker";
    record.amount        = i * 1000;
    record.fee           = i * 100;
    record.fee_recipient = "platform";
    record.fee_bps       = 1000;
    record.emitted_at_ms = NowMs();
    assert(repo.AppendEvent(*tx, record));
    assert(record.sequence == i);
  }

  auto page = repo.ReadEvents(*tx, 1, 2);
  assert(page.size() == 2);
  assert(page[0].sequence == 2);
  assert(page[0].amount == 2000);
  assert(page[0].type == LEDGER_EVENT_TYPE_SUBTASK_APPROVED);
  assert(page[0].fee_recipient == "platform");
  assert(page[1].sequence == 3);

  assert(repo.ReadEvents(*tx, 0, 100).size() == 5);
  assert(repo.ReadEvents(*tx, 5, 100).empty());
  assert(repo.ReadEvents(*tx, std::numeric_limits<uint64_t>::max(), 100).empty());
  assert(repo.ReadEvents(*tx, 0, 0).empty());
  assert(repo.GetLastEventSequence(*tx) == 5);
  tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo) {
  uint64_t counter = 0;
  uint64_t events  = 0;
  {
    auto tx = repo.Begin();
    counter = repo.GetTaskCounter(*tx);
    events  = repo.GetLastEventSequence(*tx);
    tx->Commit();
  }

  {
    auto tx = repo.Begin();
    auto id = repo.AllocateTaskId(*tx);
    assert(repo.InsertTask(*tx, NewTask(id, "rollback", 5)));
    assert(repo.InsertAdmin(*tx, "rollback-admin"));
    EventRecord record;
    record.type = LEDGER_EVENT_TYPE_TASK_FUNDED;
    assert(repo.AppendEvent(*tx, record));
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    auto id = repo.AllocateTaskId(*tx);
    assert(repo.InsertTask(*tx, NewTask(id, "dropped", 5)));
  } // destroyed without commit

  auto tx = repo.Begin();
  assert(repo.GetTaskCounter(*tx) == counter);
  assert(repo.GetLastEventSequence(*tx) == events);
  assert(!repo.GetTask(*tx, counter + 1).has_value());
  assert(!repo.IsAdmin(*tx, "rollback-admin"));
  tx->Commit();
}

void VerifyOverlappingTransactions(Repository& repo, bool supports_parallel_transactions) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertAdmin(*tx, "overlap"));
    tx->Commit();
  }

  auto outer = repo.Begin();
  auto inner = repo.Begin();

  if (supports_parallel_transactions) {
    // independent snapshots: the first writer wins and the second is refused
    assert(repo.DeleteAdmin(*outer, "overlap"));
    assert(repo.InsertAdmin(*inner, "overlap-2"));
    assert(repo.IsAdmin(*inner, "overlap"));
    outer->Commit();

    bool threw = false;
    try {
      inner->Commit();
    } catch (const std::runtime_error&) {
      threw = true;
    }
    assert(threw);

    auto verify = repo.Begin();
    assert(!repo.IsAdmin(*verify, "overlap"));
    assert(!repo.IsAdmin(*verify, "overlap-2"));
    verify->Commit();
    return;
  }

  // nested on the same thread: the inner transaction is a savepoint that
  // sees the outer writes and can be undone on its own
  assert(repo.DeleteAdmin(*outer, "overlap"));
  assert(!repo.IsAdmin(*inner, "overlap"));
  assert(repo.InsertAdmin(*inner, "overlap-2"));
  inner->Rollback();
  assert(!repo.IsAdmin(*outer, "overlap-2"));

  auto second = repo.Begin();
  assert(repo.InsertAdmin(*second, "overlap-3"));
  second->Commit();
  assert(repo.IsAdmin(*outer, "overlap-3"));

  // the released savepoint still belongs to the outer transaction
  outer->Rollback();

  auto verify = repo.Begin();
  assert(repo.IsAdmin(*verify, "overlap"));
  assert(!repo.IsAdmin(*verify, "overlap-3"));
  verify->Commit();
}

void VerifyLedgerOnBackend(const std::shared_ptr<Repository>& repo) {
  auto assets = std::make_shared<escrow::asset::MemoryAssetLedger>("custody");
  assets->Mint("client", 300000);

  escrow::core::EscrowManager manager(repo, assets);
  manager.Initialize("admin", 1000, "platform");

  auto funded = manager.FundTask("client", 100000);
  manager.ApproveSubtask("client", funded.task.id(), 0, "worker", 20000);
  manager.CompleteTask("client", funded.task.id());

  auto disputed = manager.FundTask("client", 100000);
  manager.RaiseDispute("client", disputed.task.id());
  manager.ResolveDispute("admin", disputed.task.id(), "worker", 60000);

  auto cancelled = manager.FundTask("client", 100000);
  manager.CancelTask("client", cancelled.task.id());

  bool threw = false;
  try {
    manager.ApproveSubtask("client", funded.task.id(), 0, "worker", 1);
  } catch (const escrow::util::InvalidStatus&) {
    threw = true;
  }
  assert(threw);

  assert(manager.BalanceOf("worker") == 18000 + 60000);
  assert(manager.BalanceOf("platform") == 2000);
  assert(manager.BalanceOf("client") == 300000 - 80000);
  assert(manager.BalanceOf("custody") == 0);
  assert(manager.TaskCounter() == 3);
  assert(manager.LastEventSequence() == 8);

  auto stats = manager.Stats();
  assert(stats.tasks_completed == 1);
  assert(stats.tasks_resolved == 1);
  assert(stats.tasks_cancelled == 1);
  assert(stats.value_locked == 0);
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    auto id = repo->AllocateTaskId(*tx);
    auto task = NewTask(id, "durable-client", 4242);
    assert(repo->InsertTask(*tx, task));
    assert(repo->InsertSubtaskPayment(*tx, {id, 1, "durable-worker", 42, true}));
    assert(repo->PutFeePolicy(*tx, FeePolicyRecord{1234, "durable-platform"}));
    assert(repo->InsertAdmin(*tx, "durable-admin"));
    EventRecord record;
    record.type    = LEDGER_EVENT_TYPE_TASK_FUNDED;
    record.task_id = id;
    record.amount  = 4242;
    assert(repo->AppendEvent(*tx, record));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetTaskCounter(*tx) == 1);
  auto task = repo->GetTask(*tx, 1);
  assert(task.has_value());
  assert(task->client == "durable-client");
  assert(task->total_amount == 4242);
  assert(repo->GetSubtaskPayment(*tx, 1, 1)->worker == "durable-worker");
  assert(repo->GetFeePolicy(*tx)->platform_fee_bps == 1234);
  assert(repo->IsAdmin(*tx, "durable-admin"));
  auto events = repo->ReadEvents(*tx, 0, 10);
  assert(events.size() == 1);
  assert(events[0].sequence == 1);
  assert(events[0].amount == 4242);
  // ids keep counting after a restart
  assert(repo->AllocateTaskId(*tx) == 2);
  tx->Rollback();

  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if ESCROW_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("escrow_ledger_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<escrow::db::sqlite::SqliteDB>(db_path);
    escrow::db::sqlite::SqliteRepository::BootstrapSchema(*db);
    return std::make_shared<escrow::db::sqlite::SqliteRepository>(std::move(db));
  };

  auto cleanup = [db_path]() {
    std::filesystem::remove(db_path);
    std::filesystem::remove(db_path + "-wal");
    std::filesystem::remove(db_path + "-shm");
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup                        = cleanup,
      .supports_parallel_transactions = false,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();
    VerifyTaskLifecycle(*repo);
    VerifySubtaskPayments(*repo);
    VerifyFeePolicyAndAdmins(*repo);
    VerifyEventLog(*repo);
    VerifyRollbackBehavior(*repo);
    VerifyOverlappingTransactions(*repo, backend.supports_parallel_transactions);
  }
  backend.cleanup();

  VerifyLedgerOnBackend(backend.make_repository());
  backend.cleanup();

  VerifyRestartDurability(backend);
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if ESCROW_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "escrow_ledger_integration_repository_parity: pass\n";
  return 0;
}
