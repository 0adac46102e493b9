#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace wfrun::db::sqlite {

/*
  SQLite transaction wrapper.

  BEGIN is deferred to the first statement so that a run claim can be
  committed before the database write lock is requested:
    - read-write: BEGIN IMMEDIATE (grabs the write lock early)
    - read-only:  BEGIN DEFERRED

  Run claims live in workflow_run_lock so every connection and every
  process on the file sees them. They are deleted inside the COMMIT, or
  right after a ROLLBACK.
*/
class SqliteTransaction final : public db::Transaction {
public:
  SqliteTransaction(std::unique_ptr<SqliteDB> db, TransactionMode mode, std::string owner);
  ~SqliteTransaction();

  // starts the transaction on first use
  Result Open(sqlite3*& handle);

  // Compare-and-set on the claim row. A live claim by another owner is
  // refused with LockConflict without waiting; claims acquired before
  // stale_before_ms are taken over.
  Result Claim(int64_t run_id, uint64_t now_ms, uint64_t stale_before_ms);

  SqliteDB& DB() { return *db_; }
  const std::string& Owner() const { return owner_; }
  bool ReadOnly() const { return mode_ == TransactionMode::kReadOnly; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  void DeleteClaims();

  std::unique_ptr<SqliteDB> db_;
  TransactionMode mode_;
  std::string owner_;

  bool begun_ = false;
  bool claimed_ = false;
  bool finished_ = false;
  bool committed_ = false;
};

}
