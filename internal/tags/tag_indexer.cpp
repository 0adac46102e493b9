#include "tag_indexer.hpp"

#include <algorithm>
#include <stdexcept>

namespace wfrun::tags {

namespace {

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (!result) {
    throw std::runtime_error(result.message.empty() ? context : context + ": " + result.message);
  }
}

void AddIfSet(std::vector<model::RunTag>& tags, const char* key, const std::string& value) {
  if (!value.empty()) {
    tags.push_back({key, value});
  }
}

} // namespace

TagIndexer::TagIndexer(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("tag indexer requires a repository");
  }
}

std::vector<model::RunTag> TagIndexer::Derive(const ::wfrun::v1::TriggerContext& trigger) {
  std::vector<model::RunTag> tags;
  AddIfSet(tags, kTriggeredBy, trigger.actor());
  AddIfSet(tags, kRepository, trigger.repository());
  AddIfSet(tags, kBranch, trigger.branch());
  AddIfSet(tags, kCommit, trigger.commit_hash());
  AddIfSet(tags, kAuthor, trigger.commit_author());

  // protobuf map iteration order is unspecified
  std::map<std::string, std::string> extra(trigger.extra_tags().begin(), trigger.extra_tags().end());
  for (const auto& [key, value] : extra) {
    tags.push_back({key, value});
  }
  return tags;
}

std::vector<model::RunTag> TagIndexer::Normalize(std::vector<model::RunTag> tags) {
  std::sort(tags.begin(), tags.end());
  tags.erase(std::unique(tags.begin(), tags.end()), tags.end());
  return tags;
}

void TagIndexer::DeriveAndReplace(db::Transaction& tx, model::WorkflowRun& run) {
  const auto context = "DeriveAndReplace> id=" + std::to_string(run.id);

  run.tags = Normalize(std::move(run.tags));

  ThrowIfDbError(repository_->DeleteRunTags(tx, run.id), context + " delete");
  if (run.tags.empty()) {
    return;
  }

  std::vector<db::model::RunTagRecord> records;
  records.reserve(run.tags.size());
  for (const auto& tag : run.tags) {
    records.push_back({run.id, tag.key, tag.value});
  }
  ThrowIfDbError(repository_->InsertRunTags(tx, records), context + " insert");
}

std::map<std::string, std::vector<std::string>> TagIndexer::AggregateValues(const std::string& project_key, const std::string& workflow_name) {
  auto tx = repository_->Begin(db::TransactionMode::kReadOnly);

  std::vector<db::model::RunTagRecord> pairs;
  ThrowIfDbError(repository_->ListWorkflowTagValues(*tx, project_key, workflow_name, pairs),
                 "AggregateValues> project=" + project_key + " workflow=" + workflow_name);
  tx->Commit();

  std::map<std::string, std::vector<std::string>> values;
  for (auto& pair : pairs) {
    values[pair.tag].push_back(std::move(pair.value));
  }
  for (auto& [_, list] : values) {
    std::sort(list.begin(), list.end());
    list.erase(std::unique(list.begin(), list.end()), list.end());
  }
  return values;
}

} // namespace wfrun::tags
