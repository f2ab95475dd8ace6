#include "sqlite_db.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace escrow::db::sqlite {

namespace {

void ThrowIf(int rc, sqlite3* db, const std::string& what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(what + ": " + sqlite3_errmsg(db));
  }
}

// Returns the first column of the first row as text; empty when no row.
std::string QueryText(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  ThrowIf(sqlite3_prepare_v2(db, sql, -1, &st, nullptr), db, sql);
  std::string out;
  if (sqlite3_step(st) == SQLITE_ROW) {
    if (const auto* text = sqlite3_column_text(st, 0)) out = reinterpret_cast<const char*>(text);
  }
  sqlite3_finalize(st);
  return out;
}

} // namespace

SqliteDB::SqliteDB(std::string path, bool wal_mode) : path_(std::move(path)) {
  const int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
  if (rc != SQLITE_OK) {
    std::string msg = "open ledger database '" + path_ + "': " + (db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc));
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error(msg);
  }

  try {
    Configure(wal_mode);
  } catch (const std::exception&) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char*     err = nullptr;
  const int rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    throw std::runtime_error(path_ + ": " + msg);
  }
}

void SqliteDB::Configure(bool wal_mode) {
  // wait for the writer lock instead of failing BEGIN IMMEDIATE at once
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, path_ + ": busy_timeout");

  std::string journal_mode = "delete";
  if (wal_mode) {
    // in-memory and some network filesystems silently keep the old mode
    journal_mode = QueryText(db_, "PRAGMA journal_mode=WAL;");
  }

  // ledger rows must survive a crash after COMMIT returns
  Exec("PRAGMA synchronous=FULL;");
  Exec("PRAGMA foreign_keys=ON;");
  Exec("PRAGMA temp_store=MEMORY;");

  ESCROW_LOG_INFO("Opened ledger database", {observability::StringField("path", path_),
                                             observability::StringField("journal_mode", journal_mode)});
  if (wal_mode && journal_mode != "wal") {
    ESCROW_LOG_WARN("WAL requested but not available", {observability::StringField("path", path_),
                                                        observability::StringField("journal_mode", journal_mode)});
  }
}

} // namespace escrow::db::sqlite
