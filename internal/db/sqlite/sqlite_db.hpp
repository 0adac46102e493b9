#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace wfrun::db::sqlite {

using Statement = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

/*
  Thin RAII wrapper around one sqlite3* connection.

  Connections are never shared between threads: the repository opens
  one per transaction.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  SqliteDB(std::string path, uint32_t busy_timeout_ms);
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  // Execute a SQL string (used for pragmas/migrations/transaction control)
  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

  // Prepare a statement; finalized when the handle goes out of scope
  Statement Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  uint32_t    busy_timeout_ms_;
};

} // namespace wfrun::db::sqlite
