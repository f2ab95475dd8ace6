#include "sqlite_tx.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace escrow::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)), lock_(db_->Mutex()) {
  depth_ = db_->Depth();
  if (depth_ == 0) {
    db_->Exec("BEGIN IMMEDIATE;");
  } else {
    savepoint_ = "sp_" + std::to_string(depth_);
    db_->Exec("SAVEPOINT " + savepoint_ + ";");
  }
  db_->Depth() = depth_ + 1;
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    Rollback();
  } catch (const std::exception& e) {
    ESCROW_LOG_ERROR("sqlite rollback failed", {observability::StringField("error", e.what())});
    Finish();
  }
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw std::runtime_error("transaction already finished");
  }
  if (depth_ == 0) {
    db_->Exec("COMMIT;");
  } else {
    db_->Exec("RELEASE " + savepoint_ + ";");
  }
  committed_ = true;
  Finish();
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  if (depth_ == 0) {
    db_->Exec("ROLLBACK;");
  } else {
    db_->Exec("ROLLBACK TO " + savepoint_ + ";");
    db_->Exec("RELEASE " + savepoint_ + ";");
  }
  Finish();
}

void SqliteTransaction::Finish() {
  finished_    = true;
  db_->Depth() = depth_;
  lock_.unlock();
}

} // namespace escrow::db::sqlite
