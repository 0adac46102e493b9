#pragma once

namespace wfrun::db {

enum class TransactionMode {
  kReadWrite,
  kReadOnly,
};

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Row locks taken through Repository::LockRun are owned by the
    transaction and released on Commit(), Rollback() or destruction

  SQLite: BEGIN IMMEDIATE (deferred until first statement)
  Postgres: pqxx::work
  Memory: snapshot + redo log
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

} // namespace wfrun::db
