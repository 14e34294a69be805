#pragma once

namespace alo::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - A thread holds at most one open transaction per repository

  SQLite: BEGIN IMMEDIATE under a per-connection lock
  Postgres: pqxx::work on a pooled connection
  Memory: exclusive lock + undo log
*/

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

} // namespace alo::db
