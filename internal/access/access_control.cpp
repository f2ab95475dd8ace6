#include "internal/access/access_control.hpp"

#include <stdexcept>

#include "internal/util/address.hpp"
#include "internal/util/errors.hpp"

namespace escrow::access {

const char* ToString(Role role) {
  switch (role) {
    case Role::kAdmin:
      return "admin";
    case Role::kTaskClient:
      return "client";
    case Role::kUnprivileged:
      return "unprivileged";
  }
  return "unknown";
}

AccessControl::AccessControl(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("AccessControl requires a repository");
  }
}

bool AccessControl::Bootstrap(db::Transaction& tx, const std::string& initial_admin) {
  if (!repository_->ListAdmins(tx).empty()) {
    return false;
  }
  if (!util::IsValidAddress(initial_admin)) {
    throw util::InvalidAddress("initial admin '" + initial_admin + "' is not a valid address");
  }
  db::ThrowIfError(repository_->InsertAdmin(tx, initial_admin), "seed admin set");
  return true;
}

Role AccessControl::Resolve(db::Transaction& tx, const std::string& caller, const db::model::TaskRecord* task) {
  if (caller.empty()) {
    return Role::kUnprivileged;
  }
  if (repository_->IsAdmin(tx, caller)) {
    return Role::kAdmin;
  }
  if (task && task->client == caller) {
    return Role::kTaskClient;
  }
  return Role::kUnprivileged;
}

void AccessControl::RequireAdmin(db::Transaction& tx, const std::string& caller, const char* operation) {
  if (Resolve(tx, caller) != Role::kAdmin) {
    throw util::Unauthorized(std::string(operation) + " requires admin; caller '" + caller + "' is not an admin");
  }
}

void AccessControl::RequireClientOrAdmin(db::Transaction& tx, const std::string& caller, const db::model::TaskRecord& task,
                                         const char* operation) {
  if (Resolve(tx, caller, &task) == Role::kUnprivileged) {
    throw util::Unauthorized(std::string(operation) + " on task " + std::to_string(task.id) +
                             " requires the task client or an admin");
  }
}

bool AccessControl::Grant(db::Transaction& tx, const std::string& account) {
  if (!util::IsValidAddress(account)) {
    throw util::InvalidAddress("'" + account + "' is not a valid address");
  }
  if (repository_->IsAdmin(tx, account)) {
    return false;
  }
  db::ThrowIfError(repository_->InsertAdmin(tx, account), "grant admin '" + account + "'");
  return true;
}

bool AccessControl::Revoke(db::Transaction& tx, const std::string& account) {
  if (!repository_->IsAdmin(tx, account)) {
    return false;
  }
  if (repository_->ListAdmins(tx).size() == 1) {
    throw util::InvalidStatus("cannot revoke the last admin '" + account + "'");
  }
  db::ThrowIfError(repository_->DeleteAdmin(tx, account), "revoke admin '" + account + "'");
  return true;
}

bool AccessControl::IsAdmin(db::Transaction& tx, const std::string& account) {
  return repository_->IsAdmin(tx, account);
}

} // namespace escrow::access
