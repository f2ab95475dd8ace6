#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <algorithm>
#include <cstdint>
#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace escrow::db::sqlite {

using escrow::db::ErrorCode;
using escrow::db::Result;
namespace v1 = escrow::ledger::core::v1;

namespace {

// Finalizes on scope exit so early returns cannot leak statements.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

  int Step() {
    return sqlite3_step(st_);
  }

  // Steps a query that must yield at least one row.
  void StepRow() {
    int rc = Step();
    if (rc != SQLITE_ROW) {
      throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db_));
    }
  }

 private:
  sqlite3*      db_;
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

model::TaskRecord ReadTask(sqlite3_stmt* st) {
  model::TaskRecord r;
  r.id              = ColU64(st, 0);
  r.client          = ColText(st, 1);
  r.total_amount    = ColU64(st, 2);
  r.released_amount = ColU64(st, 3);
  r.status          = static_cast<v1::TaskStatus>(ColI32(st, 4));
  r.created_at_ms   = ColU64(st, 5);
  return r;
}

model::SubtaskPaymentRecord ReadSubtaskPayment(sqlite3_stmt* st) {
  model::SubtaskPaymentRecord r;
  r.task_id       = ColU64(st, 0);
  r.subtask_index = ColU64(st, 1);
  r.worker        = ColText(st, 2);
  r.amount        = ColU64(st, 3);
  r.paid          = ColI32(st, 4) != 0;
  return r;
}

model::EventRecord ReadEvent(sqlite3_stmt* st) {
  model::EventRecord r;
  r.sequence      = ColU64(st, 0);
  r.type          = static_cast<v1::LedgerEventType>(ColI32(st, 1));
  r.task_id       = ColU64(st, 2);
  r.subtask_index = ColU64(st, 3);
  r.actor         = ColText(st, 4);
  r.counterparty  = ColText(st, 5);
  r.amount        = ColU64(st, 6);
  r.fee           = ColU64(st, 7);
  r.fee_recipient = ColText(st, 8);
  r.refund        = ColU64(st, 9);
  r.fee_bps       = static_cast<uint32_t>(ColI32(st, 10));
  r.emitted_at_ms = ColU64(st, 11);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
  db.Exec(sql::CREATE_TASKS);
  db.Exec(sql::CREATE_SUBTASK_PAYMENTS);
  db.Exec(sql::CREATE_FEE_POLICY);
  db.Exec(sql::CREATE_ADMINS);
  db.Exec(sql::CREATE_COUNTERS);
  db.Exec(sql::CREATE_EVENTS);
  db.Exec(sql::SEED_TASK_COUNTER);
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      if (rc == SQLITE_CONSTRAINT_PRIMARYKEY || rc == SQLITE_CONSTRAINT_UNIQUE)
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Tasks
// ------------------------------------------------------------------

uint64_t SqliteRepository::AllocateTaskId(Transaction& t) {
  auto* db = TX(t).Handle();
  {
    Statement st(db, sql::BUMP_TASK_COUNTER);
    ThrowIfError(Translate(db, st.Step()), "bump task counter");
  }
  return GetTaskCounter(t);
}

uint64_t SqliteRepository::GetTaskCounter(Transaction& t) {
  Statement st(TX(t).Handle(), sql::SELECT_TASK_COUNTER);
  st.StepRow();
  return ColU64(st.get(), 0);
}

Result SqliteRepository::InsertTask(Transaction& t, const model::TaskRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_TASK);

  BindU64(st.get(), 1, r.id);
  BindText(st.get(), 2, r.client);
  BindU64(st.get(), 3, r.total_amount);
  BindU64(st.get(), 4, r.released_amount);
  BindI32(st.get(), 5, static_cast<int>(r.status));
  BindU64(st.get(), 6, r.created_at_ms);

  return Translate(db, st.Step());
}

std::optional<model::TaskRecord> SqliteRepository::GetTask(Transaction& t, uint64_t id) {
  Statement st(TX(t).Handle(), sql::SELECT_TASK);
  BindU64(st.get(), 1, id);

  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadTask(st.get());
}

std::vector<model::TaskRecord> SqliteRepository::ListTasks(Transaction& t) {
  Statement                      st(TX(t).Handle(), sql::SELECT_TASKS);
  std::vector<model::TaskRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadTask(st.get()));
  }
  return out;
}

Result SqliteRepository::UpdateTask(Transaction& t, const model::TaskRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_TASK);

  BindU64(st.get(), 1, r.released_amount);
  BindI32(st.get(), 2, static_cast<int>(r.status));
  BindU64(st.get(), 3, r.id);

  auto res = Translate(db, st.Step());
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Subtask payments
// ------------------------------------------------------------------

Result SqliteRepository::InsertSubtaskPayment(Transaction& t, const model::SubtaskPaymentRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_SUBTASK_PAYMENT);

  BindU64(st.get(), 1, r.task_id);
  BindU64(st.get(), 2, r.subtask_index);
  BindText(st.get(), 3, r.worker);
  BindU64(st.get(), 4, r.amount);
  BindI32(st.get(), 5, r.paid ? 1 : 0);

  return Translate(db, st.Step());
}

std::optional<model::SubtaskPaymentRecord> SqliteRepository::GetSubtaskPayment(Transaction& t, uint64_t task_id, uint64_t subtask_index) {
  Statement st(TX(t).Handle(), sql::SELECT_SUBTASK_PAYMENT);
  BindU64(st.get(), 1, task_id);
  BindU64(st.get(), 2, subtask_index);

  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadSubtaskPayment(st.get());
}

std::vector<model::SubtaskPaymentRecord> SqliteRepository::ListSubtaskPayments(Transaction& t, uint64_t task_id) {
  Statement st(TX(t).Handle(), sql::SELECT_SUBTASK_PAYMENTS);
  BindU64(st.get(), 1, task_id);

  std::vector<model::SubtaskPaymentRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadSubtaskPayment(st.get()));
  }
  return out;
}

// ------------------------------------------------------------------
// Fee policy
// ------------------------------------------------------------------

std::optional<model::FeePolicyRecord> SqliteRepository::GetFeePolicy(Transaction& t) {
  Statement st(TX(t).Handle(), sql::SELECT_FEE_POLICY);
  if (st.Step() != SQLITE_ROW) return std::nullopt;

  model::FeePolicyRecord r;
  r.platform_fee_bps = static_cast<uint32_t>(ColI32(st.get(), 0));
  r.fee_recipient    = ColText(st.get(), 1);
  return r;
}

Result SqliteRepository::PutFeePolicy(Transaction& t, const model::FeePolicyRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPSERT_FEE_POLICY);

  BindI32(st.get(), 1, static_cast<int>(r.platform_fee_bps));
  BindText(st.get(), 2, r.fee_recipient);

  return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Admins
// ------------------------------------------------------------------

Result SqliteRepository::InsertAdmin(Transaction& t, const std::string& account) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_ADMIN);
  BindText(st.get(), 1, account);
  return Translate(db, st.Step());
}

Result SqliteRepository::DeleteAdmin(Transaction& t, const std::string& account) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::DELETE_ADMIN);
  BindText(st.get(), 1, account);

  auto res = Translate(db, st.Step());
  if (!res) return res;
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

bool SqliteRepository::IsAdmin(Transaction& t, const std::string& account) {
  Statement st(TX(t).Handle(), sql::SELECT_ADMIN);
  BindText(st.get(), 1, account);
  return st.Step() == SQLITE_ROW;
}

std::vector<std::string> SqliteRepository::ListAdmins(Transaction& t) {
  Statement                st(TX(t).Handle(), sql::SELECT_ADMINS);
  std::vector<std::string> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ColText(st.get(), 0));
  }
  return out;
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result SqliteRepository::AppendEvent(Transaction& t, model::EventRecord& r) {
  auto* db = TX(t).Handle();
  r.sequence = GetLastEventSequence(t) + 1;

  Statement st(db, sql::INSERT_EVENT);
  BindU64(st.get(), 1, r.sequence);
  BindI32(st.get(), 2, static_cast<int>(r.type));
  BindU64(st.get(), 3, r.task_id);
  BindU64(st.get(), 4, r.subtask_index);
  BindText(st.get(), 5, r.actor);
  BindText(st.get(), 6, r.counterparty);
  BindU64(st.get(), 7, r.amount);
  BindU64(st.get(), 8, r.fee);
  BindText(st.get(), 9, r.fee_recipient);
  BindU64(st.get(), 10, r.refund);
  BindI32(st.get(), 11, static_cast<int>(r.fee_bps));
  BindU64(st.get(), 12, r.emitted_at_ms);

  return Translate(db, st.Step());
}

std::vector<model::EventRecord> SqliteRepository::ReadEvents(Transaction& t, uint64_t after_sequence, uint64_t max_events) {
  if (after_sequence >= static_cast<uint64_t>(INT64_MAX)) return {};

  Statement st(TX(t).Handle(), sql::SELECT_EVENTS_AFTER);
  BindU64(st.get(), 1, after_sequence);
  // LIMIT is signed in sqlite
  BindU64(st.get(), 2, std::min<uint64_t>(max_events, static_cast<uint64_t>(INT64_MAX)));

  std::vector<model::EventRecord> out;
  while (st.Step() == SQLITE_ROW) {
    out.push_back(ReadEvent(st.get()));
  }
  return out;
}

uint64_t SqliteRepository::GetLastEventSequence(Transaction& t) {
  Statement st(TX(t).Handle(), sql::SELECT_LAST_EVENT_SEQUENCE);
  st.StepRow();
  return ColU64(st.get(), 0);
}

} // namespace escrow::db::sqlite
