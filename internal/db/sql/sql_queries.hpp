#pragma once

namespace escrow::db::sql {

/*
  Canonical ledger SQL.

  Amounts are unsigned 64-bit values stored in INTEGER columns through
  sqlite3_bind_int64; the bit pattern round-trips, so values above
  INT64_MAX must never be compared or summed inside SQL.
*/

// schema

static constexpr const char* CREATE_TASKS =
    "CREATE TABLE IF NOT EXISTS escrow_task ("
    " id INTEGER PRIMARY KEY,"
    " client TEXT NOT NULL,"
    " total_amount INTEGER NOT NULL,"
    " released_amount INTEGER NOT NULL,"
    " status INTEGER NOT NULL,"
    " created_at_ms INTEGER NOT NULL);";

static constexpr const char* CREATE_SUBTASK_PAYMENTS =
    "CREATE TABLE IF NOT EXISTS escrow_subtask_payment ("
    " task_id INTEGER NOT NULL REFERENCES escrow_task(id),"
    " subtask_index INTEGER NOT NULL,"
    " worker TEXT NOT NULL,"
    " amount INTEGER NOT NULL,"
    " paid INTEGER NOT NULL,"
    " PRIMARY KEY (task_id, subtask_index));";

static constexpr const char* CREATE_FEE_POLICY =
    "CREATE TABLE IF NOT EXISTS escrow_fee_policy ("
    " singleton INTEGER PRIMARY KEY CHECK (singleton = 1),"
    " platform_fee_bps INTEGER NOT NULL,"
    " fee_recipient TEXT NOT NULL);";

static constexpr const char* CREATE_ADMINS =
    "CREATE TABLE IF NOT EXISTS escrow_admin (account TEXT PRIMARY KEY);";

static constexpr const char* CREATE_COUNTERS =
    "CREATE TABLE IF NOT EXISTS escrow_counter (name TEXT PRIMARY KEY, value INTEGER NOT NULL);";

static constexpr const char* CREATE_EVENTS =
    "CREATE TABLE IF NOT EXISTS escrow_event ("
    " sequence INTEGER PRIMARY KEY,"
    " type INTEGER NOT NULL,"
    " task_id INTEGER NOT NULL,"
    " subtask_index INTEGER NOT NULL,"
    " actor TEXT NOT NULL,"
    " counterparty TEXT NOT NULL,"
    " amount INTEGER NOT NULL,"
    " fee INTEGER NOT NULL,"
    " fee_recipient TEXT NOT NULL,"
    " refund INTEGER NOT NULL,"
    " fee_bps INTEGER NOT NULL,"
    " emitted_at_ms INTEGER NOT NULL);";

static constexpr const char* SEED_TASK_COUNTER =
    "INSERT OR IGNORE INTO escrow_counter(name,value) VALUES('task',0);";

// tasks

static constexpr const char* BUMP_TASK_COUNTER =
    "UPDATE escrow_counter SET value=value+1 WHERE name='task';";

static constexpr const char* SELECT_TASK_COUNTER =
    "SELECT value FROM escrow_counter WHERE name='task';";

static constexpr const char* INSERT_TASK =
    "INSERT INTO escrow_task(id,client,total_amount,released_amount,status,created_at_ms)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* SELECT_TASK =
    "SELECT id,client,total_amount,released_amount,status,created_at_ms"
    " FROM escrow_task WHERE id=?;";

static constexpr const char* SELECT_TASKS =
    "SELECT id,client,total_amount,released_amount,status,created_at_ms"
    " FROM escrow_task ORDER BY id;";

static constexpr const char* UPDATE_TASK =
    "UPDATE escrow_task SET released_amount=?,status=? WHERE id=?;";

// subtask payments

static constexpr const char* INSERT_SUBTASK_PAYMENT =
    "INSERT INTO escrow_subtask_payment(task_id,subtask_index,worker,amount,paid)"
    " VALUES(?,?,?,?,?);";

static constexpr const char* SELECT_SUBTASK_PAYMENT =
    "SELECT task_id,subtask_index,worker,amount,paid"
    " FROM escrow_subtask_payment WHERE task_id=? AND subtask_index=?;";

static constexpr const char* SELECT_SUBTASK_PAYMENTS =
    "SELECT task_id,subtask_index,worker,amount,paid"
    " FROM escrow_subtask_payment WHERE task_id=? ORDER BY subtask_index;";

// fee policy

static constexpr const char* SELECT_FEE_POLICY =
    "SELECT platform_fee_bps,fee_recipient FROM escrow_fee_policy WHERE singleton=1;";

static constexpr const char* UPSERT_FEE_POLICY =
    "INSERT INTO escrow_fee_policy(singleton,platform_fee_bps,fee_recipient) VALUES(1,?,?)"
    " ON CONFLICT(singleton) DO UPDATE SET"
    " platform_fee_bps=excluded.platform_fee_bps,"
    " fee_recipient=excluded.fee_recipient;";

// admins

static constexpr const char* INSERT_ADMIN =
    "INSERT INTO escrow_admin(account) VALUES(?);";

static constexpr const char* DELETE_ADMIN =
    "DELETE FROM escrow_admin WHERE account=?;";

static constexpr const char* SELECT_ADMIN =
    "SELECT 1 FROM escrow_admin WHERE account=?;";

static constexpr const char* SELECT_ADMINS =
    "SELECT account FROM escrow_admin ORDER BY account;";

// events

static constexpr const char* SELECT_LAST_EVENT_SEQUENCE =
    "SELECT COALESCE(MAX(sequence),0) FROM escrow_event;";

static constexpr const char* INSERT_EVENT =
    "INSERT INTO escrow_event(sequence,type,task_id,subtask_index,actor,counterparty,"
    "amount,fee,fee_recipient,refund,fee_bps,emitted_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_EVENTS_AFTER =
    "SELECT sequence,type,task_id,subtask_index,actor,counterparty,"
    "amount,fee,fee_recipient,refund,fee_bps,emitted_at_ms"
    " FROM escrow_event WHERE sequence>? ORDER BY sequence LIMIT ?;";

} // namespace escrow::db::sql
