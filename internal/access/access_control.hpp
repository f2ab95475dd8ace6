#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"

namespace escrow::access {

/*
  Caller classification.

  A caller is an admin if it is a member of the persisted admin set,
  otherwise the client of a task if it funded that task, otherwise
  unprivileged. Admin takes precedence when both hold.
*/
enum class Role {
  kUnprivileged,
  kTaskClient,
  kAdmin,
};

const char* ToString(Role role);

class AccessControl {
 public:
  explicit AccessControl(std::shared_ptr<db::Repository> repository);

  // Seeds the admin set with initial_admin if it is empty. Returns true when seeded.
  bool Bootstrap(db::Transaction& tx, const std::string& initial_admin);

  Role Resolve(db::Transaction& tx, const std::string& caller, const db::model::TaskRecord* task = nullptr);

  // Throw util::Unauthorized.
  void RequireAdmin(db::Transaction& tx, const std::string& caller, const char* operation);
  void RequireClientOrAdmin(db::Transaction& tx, const std::string& caller, const db::model::TaskRecord& task,
                            const char* operation);

  // Return true when membership changed.
  bool Grant(db::Transaction& tx, const std::string& account);
  bool Revoke(db::Transaction& tx, const std::string& account);

  bool IsAdmin(db::Transaction& tx, const std::string& account);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace escrow::access
