#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/lock/row_lock_table.hpp"

namespace wfrun::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::map<int64_t, model::RunRecord>     runs;
    std::map<int64_t, model::NodeRunRecord> node_runs;

    // (run id, tag, value)
    std::set<std::tuple<int64_t, std::string, std::string>> tags;
  };

  std::mutex mutex_;
  State      committed_;

  std::mutex                           sequence_mutex_;
  std::unordered_map<int64_t, int64_t> sequences_;

  // identities are never reused, even when the inserting transaction rolls back
  std::atomic<int64_t>  next_run_id_{1};
  std::atomic<int64_t>  next_node_run_id_{1};
  std::atomic<uint64_t> next_tx_id_{1};

  lock::RowLockTable row_locks_;
};

}
