#include "sqlite_db.hpp"

#include <stdexcept>

namespace wfrun::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, uint32_t busy_timeout_ms) : path_(std::move(path)), busy_timeout_ms_(busy_timeout_ms) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

Statement SqliteDB::Prepare(const std::string& sql) {
  sqlite3_stmt* stmt = nullptr;
  int           rc   = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
  Statement     owned(stmt, &sqlite3_finalize);
  ThrowIf(rc, db_, "sqlite prepare");
  return owned;
}

void SqliteDB::Configure() {
  // wait for the database lock instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout_ms_ == 0 ? 5000 : busy_timeout_ms_)), db_, "busy_timeout");

  // WAL keeps readers off the writer's lock
  Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=NORMAL;");

  // foreign keys are OFF by default in sqlite
  Exec("PRAGMA foreign_keys=ON;");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace wfrun::db::sqlite
