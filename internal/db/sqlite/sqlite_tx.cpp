#include "sqlite_tx.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace wfrun::db::sqlite {

namespace {

Result StepError(sqlite3* db, int rc) {
  if ((rc & 0xff) == SQLITE_BUSY || (rc & 0xff) == SQLITE_LOCKED) {
    return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
  }
  return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
}

} // namespace

SqliteTransaction::SqliteTransaction(std::unique_ptr<SqliteDB> db, TransactionMode mode, std::string owner)
    : db_(std::move(db)), mode_(mode), owner_(std::move(owner)) {
}

SqliteTransaction::~SqliteTransaction() {
  if (finished_) return;
  try {
    if (begun_) {
      db_->Exec("ROLLBACK;");
    }
    DeleteClaims();
  } catch (const std::exception& e) {
    WFRUN_LOG_WARN("sqlite rollback failed", {observability::StringField("owner", owner_), observability::StringField("error", e.what())});
  }
}

Result SqliteTransaction::Open(sqlite3*& handle) {
  if (finished_) {
    return Result::Err(ErrorCode::InternalError, "sqlite transaction already finished");
  }
  if (!begun_) {
    const char* begin = mode_ == TransactionMode::kReadOnly ? "BEGIN DEFERRED;" : "BEGIN IMMEDIATE;";
    int rc = sqlite3_exec(db_->Handle(), begin, nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
      return StepError(db_->Handle(), rc);
    }
    begun_ = true;
  }
  handle = db_->Handle();
  return Result::Ok();
}

Result SqliteTransaction::Claim(int64_t run_id, uint64_t now_ms, uint64_t stale_before_ms) {
  if (finished_) {
    return Result::Err(ErrorCode::InternalError, "sqlite transaction already finished");
  }
  sqlite3* db = db_->Handle();
  const std::string run = "run " + std::to_string(run_id);

  // WAL readers never wait on the writer, so a held claim is seen at once
  {
    Statement st(nullptr, &sqlite3_finalize);
    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, "SELECT owner,acquired_ms FROM workflow_run_lock WHERE run_id=?;", -1, &raw, nullptr) != SQLITE_OK) {
      return Result::Err(ErrorCode::InternalError, std::string("prepare: ") + sqlite3_errmsg(db));
    }
    st.reset(raw);
    sqlite3_bind_int64(st.get(), 1, run_id);

    int rc = sqlite3_step(st.get());
    if (rc == SQLITE_ROW) {
      const auto* owner    = reinterpret_cast<const char*>(sqlite3_column_text(st.get(), 0));
      const auto  acquired = static_cast<uint64_t>(sqlite3_column_int64(st.get(), 1));
      if (owner != nullptr && owner_ == owner) {
        return Result::Ok();
      }
      if (acquired >= stale_before_ms) {
        return Result::Err(ErrorCode::LockConflict, run + " is locked by " + (owner ? owner : "?"));
      }
    } else if (rc != SQLITE_DONE) {
      return StepError(db, rc);
    }
  }

  Statement st(nullptr, &sqlite3_finalize);
  sqlite3_stmt* raw = nullptr;
  const char* sql =
      "INSERT INTO workflow_run_lock(run_id,owner,acquired_ms) VALUES(?1,?2,?3) "
      "ON CONFLICT(run_id) DO UPDATE SET owner=excluded.owner, acquired_ms=excluded.acquired_ms "
      "WHERE workflow_run_lock.owner=excluded.owner OR workflow_run_lock.acquired_ms<?4;";
  if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
    return Result::Err(ErrorCode::InternalError, std::string("prepare: ") + sqlite3_errmsg(db));
  }
  st.reset(raw);
  sqlite3_bind_int64(st.get(), 1, run_id);
  sqlite3_bind_text(st.get(), 2, owner_.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(st.get(), 3, static_cast<sqlite3_int64>(now_ms));
  sqlite3_bind_int64(st.get(), 4, static_cast<sqlite3_int64>(stale_before_ms));

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) {
    return StepError(db, rc);
  }
  // lost the race against another claimant between the read and the write
  if (sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::LockConflict, run + " is locked");
  }
  claimed_ = true;
  return Result::Ok();
}

void SqliteTransaction::DeleteClaims() {
  if (!claimed_) return;

  auto st = db_->Prepare("DELETE FROM workflow_run_lock WHERE owner=?;");
  sqlite3_bind_text(st.get(), 1, owner_.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(st.get()) != SQLITE_DONE) {
    throw std::runtime_error("release run claims of " + owner_ + ": " + sqlite3_errmsg(db_->Handle()));
  }
}

void SqliteTransaction::Commit() {
  if (finished_) {
    throw std::runtime_error("sqlite transaction already finished");
  }
  // inside the open transaction the claim disappears together with the COMMIT
  DeleteClaims();
  if (begun_) {
    db_->Exec("COMMIT;");
  }
  claimed_ = false;
  committed_ = true;
  finished_ = true;
}

void SqliteTransaction::Rollback() {
  if (finished_) return;
  finished_ = true;
  if (begun_) {
    db_->Exec("ROLLBACK;");
  }
  DeleteClaims();
  claimed_ = false;
}

}
