#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace escrow::db::sqlite {

/*
  SQLite transaction wrapper.

  Outermost transaction uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later

  A transaction opened on a thread that already holds one becomes a
  SAVEPOINT inside it and sees the outer transaction's uncommitted writes.
*/
class SqliteTransaction final : public db::Transaction {
public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  void Finish();

  std::shared_ptr<SqliteDB>              db_;
  std::unique_lock<std::recursive_mutex> lock_;
  int                                    depth_ = 0;
  std::string                            savepoint_;
  bool                                   committed_ = false;
  bool                                   finished_  = false;
};

} // namespace escrow::db::sqlite
