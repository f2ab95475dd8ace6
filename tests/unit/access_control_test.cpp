#include <cassert>
#include <iostream>
#include <memory>

#include "internal/access/access_control.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using escrow::access::AccessControl;
using escrow::access::Role;
using escrow::db::memory::MemoryRepository;

template <typename E, typename Fn>
void ExpectThrows(Fn&& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const E&) {
    threw = true;
  }
  assert(threw);
}

escrow::db::model::TaskRecord TaskOwnedBy(const std::string& client) {
  escrow::db::model::TaskRecord task;
  task.id           = 7;
  task.client       = client;
  task.total_amount = 100;
  task.status       = escrow::ledger::core::v1::TASK_STATUS_FUNDED;
  return task;
}

void TestBootstrapSeedsOnlyOnce() {
  auto          repository = std::make_shared<MemoryRepository>();
  AccessControl access(repository);

  auto tx = repository->Begin();
  ExpectThrows<escrow::util::InvalidAddress>([&] { access.Bootstrap(*tx, ""); });
  assert(access.Bootstrap(*tx, "root"));
  assert(!access.Bootstrap(*tx, "intruder"));
  assert(access.IsAdmin(*tx, "root"));
  assert(!access.IsAdmin(*tx, "intruder"));
  tx->Commit();
}

void TestRoleResolution() {
  auto          repository = std::make_shared<MemoryRepository>();
  AccessControl access(repository);

  auto tx = repository->Begin();
  access.Bootstrap(*tx, "root");
  const auto task = TaskOwnedBy("alice");

  assert(access.Resolve(*tx, "root") == Role::kAdmin);
  assert(access.Resolve(*tx, "alice") == Role::kUnprivileged);
  assert(access.Resolve(*tx, "alice", &task) == Role::kTaskClient);
  assert(access.Resolve(*tx, "bob", &task) == Role::kUnprivileged);
  assert(access.Resolve(*tx, "", &task) == Role::kUnprivileged);

  // admin wins over client
  const auto own_task = TaskOwnedBy("root");
  assert(access.Resolve(*tx, "root", &own_task) == Role::kAdmin);

  access.RequireAdmin(*tx, "root", "test");
  access.RequireClientOrAdmin(*tx, "alice", task, "test");
  access.RequireClientOrAdmin(*tx, "root", task, "test");
  ExpectThrows<escrow::util::Unauthorized>([&] { access.RequireAdmin(*tx, "alice", "test"); });
  ExpectThrows<escrow::util::Unauthorized>([&] { access.RequireClientOrAdmin(*tx, "bob", task, "test"); });
}

void TestGrantAndRevoke() {
  auto          repository = std::make_shared<MemoryRepository>();
  AccessControl access(repository);

  auto tx = repository->Begin();
  access.Bootstrap(*tx, "root");

  assert(access.Grant(*tx, "ops"));
  assert(!access.Grant(*tx, "ops"));
  ExpectThrows<escrow::util::InvalidAddress>([&] { access.Grant(*tx, "0x00"); });
  assert(access.IsAdmin(*tx, "ops"));

  assert(access.Revoke(*tx, "root"));
  assert(!access.Revoke(*tx, "root"));
  assert(!access.IsAdmin(*tx, "root"));

  ExpectThrows<escrow::util::InvalidStatus>([&] { access.Revoke(*tx, "ops"); });
  assert(access.IsAdmin(*tx, "ops"));
  tx->Commit();

  auto read_tx = repository->Begin();
  assert(access.IsAdmin(*read_tx, "ops"));
  assert(!access.IsAdmin(*read_tx, "root"));
}

} // namespace

int main() {
  TestBootstrapSeedsOnlyOnce();
  TestRoleResolution();
  TestGrantAndRevoke();

  std::cout << "escrow_ledger_unit_access_control: pass\n";
  return 0;
}
