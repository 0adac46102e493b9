#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace wfrun::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  SqliteRepository(std::string path, uint32_t busy_timeout_ms);

  // Applies the schema on a dedicated connection.
  void Migrate();

  std::unique_ptr<Transaction> Begin(TransactionMode mode = TransactionMode::kReadWrite) override;

  Result NextRunNumber(int64_t workflow_id, int64_t& number) override;

  Result InsertRun(Transaction&, model::RunRecord&) override;
  Result UpdateRun(Transaction&, const model::RunRecord&) override;
  Result FindRun(Transaction&, const RunSelector&, std::optional<model::RunRecord>&) override;
  Result LockRun(Transaction&, int64_t run_id) override;
  Result CountRuns(Transaction&, const std::string& project_key, const std::string& workflow_name, int64_t& count) override;
  Result ListRuns(Transaction&, const std::string& project_key, const std::string& workflow_name, const Pagination&,
                  std::vector<model::RunRecord>&) override;

  Result InsertNodeRun(Transaction&, model::NodeRunRecord&) override;
  Result UpdateNodeRun(Transaction&, const model::NodeRunRecord&) override;
  Result ListNodeRuns(Transaction&, int64_t run_id, std::vector<model::NodeRunRecord>&) override;

  Result DeleteRunTags(Transaction&, int64_t run_id) override;
  Result InsertRunTags(Transaction&, const std::vector<model::RunTagRecord>&) override;
  Result ListRunTags(Transaction&, int64_t run_id, std::vector<model::RunTagRecord>&) override;
  Result ListWorkflowTagValues(Transaction&, const std::string& project_key, const std::string& workflow_name,
                               std::vector<model::RunTagRecord>&) override;

private:
  std::unique_ptr<SqliteDB> Connect() const;

  static SqliteTransaction& TX(Transaction& t);
  static Result OpenForWrite(Transaction& t, sqlite3*& db);
  static Result Translate(sqlite3* db, int rc);

  std::string path_;
  uint32_t busy_timeout_ms_;

  // distinguishes this instance's claims from other processes on the file
  std::string owner_prefix_;
  std::atomic<uint64_t> next_tx_id_{1};
};

}
