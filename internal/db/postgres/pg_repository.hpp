#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace wfrun::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  // Applies the schema (tables + workflow_sequences_nextval) in one transaction
  // on a connection outside the pool. Must run before the first Begin().
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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
