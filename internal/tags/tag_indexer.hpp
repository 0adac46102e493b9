#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/workflow_run.hpp"
#include "wfrun/v1.hpp"

namespace wfrun::tags {

/*
  Maintains the searchable tag set of each run.

  A run's tags are always fully replaced, never patched: delete every
  row of the run, then insert the normalized set (nothing when empty).
*/
class TagIndexer {
 public:
  static constexpr const char* kTriggeredBy = "triggered_by";
  static constexpr const char* kRepository  = "repository";
  static constexpr const char* kBranch      = "branch";
  static constexpr const char* kCommit      = "commit";
  static constexpr const char* kAuthor      = "author";

  explicit TagIndexer(std::shared_ptr<db::Repository> repository);

  // Fixed trigger keys (empty values skipped) followed by extra_tags.
  static std::vector<model::RunTag> Derive(const ::wfrun::v1::TriggerContext& trigger);

  // Sorted, duplicates removed.
  static std::vector<model::RunTag> Normalize(std::vector<model::RunTag> tags);

  // Normalizes run.tags in place and persists them inside tx.
  void DeriveAndReplace(db::Transaction& tx, model::WorkflowRun& run);

  // key -> sorted distinct values over every run of the workflow
  std::map<std::string, std::vector<std::string>> AggregateValues(const std::string& project_key, const std::string& workflow_name);

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace wfrun::tags
