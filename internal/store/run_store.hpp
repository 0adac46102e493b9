#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/workflow_run.hpp"

namespace wfrun::store {

struct RunPage {
  std::vector<model::WorkflowRun> runs;

  std::size_t offset = 0;
  std::size_t limit  = 0;
  int64_t     total  = 0;
};

/*
  Transactional persistence of runs, node runs and tags.

  Translates repository results into util exceptions:
    NotFound / LockConflict / SerializationError, anything else as
    std::runtime_error prefixed with the operation and its keys.

  Blobs are encoded before every write and decoded on every read.
*/
class RunStore {
 public:
  explicit RunStore(std::shared_ptr<db::Repository> repository);

  std::unique_ptr<db::Transaction> Begin(db::TransactionMode mode = db::TransactionMode::kReadWrite);

  // Atomic, durable, independent of any open transaction.
  int64_t NextRunNumber(int64_t workflow_id);

  // Assigns run.id and the ids of any node runs the run already carries.
  void InsertRun(db::Transaction& tx, model::WorkflowRun& run);

  // Refreshes last_modified_at; forces Fail when any info is an error.
  void UpdateRun(db::Transaction& tx, model::WorkflowRun& run);

  // Runs in its own read-only transaction.
  model::WorkflowRun LoadRun(const db::RunSelector& selector);
  model::WorkflowRun LoadRun(db::Transaction& tx, const db::RunSelector& selector);

  // Newest first; node runs are not populated.
  RunPage LoadRuns(const std::string& project_key, const std::string& workflow_name, std::size_t offset, std::size_t limit);

  // Fails immediately with util::LockConflict when another transaction holds the run.
  model::WorkflowRun LoadAndLockRun(db::Transaction& tx, int64_t run_id);

  void InsertNodeRun(db::Transaction& tx, model::NodeRun& node_run);
  void UpdateNodeRun(db::Transaction& tx, const model::NodeRun& node_run);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace wfrun::store
