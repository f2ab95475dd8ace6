#pragma once

namespace escrow::db {

/*
  Ledger transaction handle.

  Every repository read and write goes through one. A ledger mutation
  opens exactly one, and the asset transfer for that mutation commits only
  after it does.

  All backends:
    - writes are invisible outside the transaction until Commit()
    - Rollback() and destruction without Commit() discard every write
    - Commit() or Rollback() ends the transaction; a second Commit() throws

  Memory: private snapshot. Commit() throws std::runtime_error if another
          transaction committed a write first; read-only commits never do.
  SQLite: BEGIN IMMEDIATE. A transaction begun on a thread that already
          holds one becomes a SAVEPOINT inside it and sees its writes.
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;
};

} // namespace escrow::db
