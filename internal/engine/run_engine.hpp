#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/engine/node_dispatcher.hpp"
#include "internal/model/workflow_run.hpp"
#include "internal/store/run_store.hpp"
#include "internal/tags/tag_indexer.hpp"
#include "wfrun/v1.hpp"

namespace wfrun::engine {

struct EngineOptions {
  std::size_t default_page_limit = 50;
  std::size_t max_page_limit     = 500;
};

/*
  Business rules of a workflow run.

  Every mutation runs as: lock run -> mutate -> recompute status ->
  persist run + tags -> commit -> dispatch ready nodes. A run that is
  already locked is refused immediately with util::LockConflict; retry
  policy belongs to the caller.
*/
class RunEngine {
 public:
  RunEngine(std::shared_ptr<store::RunStore> store, std::shared_ptr<tags::TagIndexer> tags, std::shared_ptr<NodeDispatcher> dispatcher = nullptr,
            EngineOptions options = {});

  model::WorkflowRun CreateRun(const ::wfrun::v1::Workflow& workflow, const ::wfrun::v1::TriggerContext& trigger);

  model::WorkflowRun AdvanceNode(int64_t run_id, int64_t node_id, model::Status status, const std::vector<::wfrun::v1::RunInfo>& infos = {});

  model::WorkflowRun StopRun(int64_t run_id, const std::string& actor);

  model::WorkflowRun LoadLastRun(const std::string& project_key, const std::string& workflow_name);
  model::WorkflowRun LoadRun(const std::string& project_key, const std::string& workflow_name, int64_t number);
  model::WorkflowRun LoadRunByID(int64_t run_id);
  model::WorkflowRun LoadRunByIDAndProjectKey(const std::string& project_key, int64_t run_id);

  // limit <= 0 selects the default page size; larger limits are clamped.
  store::RunPage LoadRuns(const std::string& project_key, const std::string& workflow_name, int64_t offset, int64_t limit);

  std::map<std::string, std::vector<std::string>> AggregateTagValues(const std::string& project_key, const std::string& workflow_name);

 private:
  void Dispatch(const model::WorkflowRun& run, const std::vector<model::NodeRun>& ready);

  std::shared_ptr<store::RunStore>  store_;
  std::shared_ptr<tags::TagIndexer> tags_;
  std::shared_ptr<NodeDispatcher>   dispatcher_;
  EngineOptions                     options_;
};

} // namespace wfrun::engine
