#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace escrow::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.

  One connection is shared by every transaction. The recursive mutex
  serialises transactions across threads while still allowing a thread
  that already holds a transaction to open a nested one (SAVEPOINT).
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/schema)
  void Exec(const std::string& sql);

  std::recursive_mutex& Mutex() {
    return mutex_;
  }

  // Nesting depth of the transaction currently holding Mutex().
  int& Depth() {
    return depth_;
  }

 private:
  void Configure(bool wal_mode);

  sqlite3*             db_ = nullptr;
  std::string          path_;
  std::recursive_mutex mutex_;
  int                  depth_ = 0;
};

} // namespace escrow::db::sqlite
