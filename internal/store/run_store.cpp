#include "run_store.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/serializer/serializer.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace wfrun::store {

namespace {

using serializer::Serializer;

void ThrowIfDbError(const db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(message);
    case db::ErrorCode::LockConflict:
      throw util::LockConflict(message);
    default:
      throw std::runtime_error(message);
  }
}

std::string Keys(const model::WorkflowRun& run) {
  return "project=" + run.project_key + " workflow=" + run.workflow_name + " id=" + std::to_string(run.id) + " number=" + std::to_string(run.number);
}

bool HasErrorInfo(const model::WorkflowRun& run) {
  return std::any_of(run.infos.begin(), run.infos.end(), [](const ::wfrun::v1::RunInfo& info) { return info.is_error(); });
}

db::model::RunRecord ToRecord(const model::WorkflowRun& run, const std::string& context) {
  db::model::RunRecord record;
  record.id               = run.id;
  record.workflow_id      = run.workflow_id;
  record.project_id       = run.project_id;
  record.project_key      = run.project_key;
  record.workflow_name    = run.workflow_name;
  record.number           = run.number;
  record.status           = static_cast<int32_t>(run.status);
  record.stop_requested   = run.stop_requested;
  record.started_at_ms    = util::ToUnixMillis(run.started_at);
  record.last_modified_ms = util::ToUnixMillis(run.last_modified_at);

  try {
    record.workflow_blob = Serializer::EncodeSnapshot(run.workflow);
    record.infos_blob    = Serializer::EncodeInfos(run.infos);
  } catch (const util::SerializationError& e) {
    throw util::SerializationError(context + ": " + e.what());
  }
  return record;
}

model::WorkflowRun FromRecord(const db::model::RunRecord& record, const std::string& context) {
  model::WorkflowRun run;
  run.id               = record.id;
  run.number           = record.number;
  run.workflow_id      = record.workflow_id;
  run.project_id       = record.project_id;
  run.project_key      = record.project_key;
  run.workflow_name    = record.workflow_name;
  run.status           = static_cast<model::Status>(record.status);
  run.stop_requested   = record.stop_requested;
  run.started_at       = util::FromUnixMillis(record.started_at_ms);
  run.last_modified_at = util::FromUnixMillis(record.last_modified_ms);

  try {
    run.workflow = Serializer::DecodeSnapshot(record.workflow_blob);
    run.infos    = Serializer::DecodeInfos(record.infos_blob);
  } catch (const util::SerializationError& e) {
    throw util::SerializationError(context + ": " + e.what());
  }
  return run;
}

db::model::NodeRunRecord ToRecord(const model::NodeRun& node_run) {
  db::model::NodeRunRecord record;
  record.id               = node_run.id;
  record.workflow_run_id  = node_run.workflow_run_id;
  record.node_id          = node_run.node_id;
  record.sub_number       = node_run.sub_number;
  record.status           = static_cast<int32_t>(node_run.status);
  record.started_at_ms    = util::ToUnixMillis(node_run.started_at);
  record.finished_at_ms   = util::ToUnixMillis(node_run.finished_at);
  record.last_modified_ms = util::ToUnixMillis(node_run.last_modified_at);
  return record;
}

model::NodeRun FromRecord(const db::model::NodeRunRecord& record) {
  model::NodeRun node_run;
  node_run.id               = record.id;
  node_run.workflow_run_id  = record.workflow_run_id;
  node_run.node_id          = record.node_id;
  node_run.sub_number       = record.sub_number;
  node_run.status           = static_cast<model::Status>(record.status);
  node_run.started_at       = util::FromUnixMillis(record.started_at_ms);
  node_run.finished_at      = util::FromUnixMillis(record.finished_at_ms);
  node_run.last_modified_at = util::FromUnixMillis(record.last_modified_ms);
  return node_run;
}

void LoadTags(db::Repository& repository, db::Transaction& tx, model::WorkflowRun& run, const std::string& context) {
  std::vector<db::model::RunTagRecord> tags;
  ThrowIfDbError(repository.ListRunTags(tx, run.id, tags), context + " tags");

  run.tags.clear();
  run.tags.reserve(tags.size());
  for (auto& tag : tags) {
    run.tags.push_back({std::move(tag.tag), std::move(tag.value)});
  }
}

} // namespace

RunStore::RunStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
  if (!repository_) {
    throw std::invalid_argument("run store requires a repository");
  }
}

std::unique_ptr<db::Transaction> RunStore::Begin(db::TransactionMode mode) {
  return repository_->Begin(mode);
}

int64_t RunStore::NextRunNumber(int64_t workflow_id) {
  int64_t number = 0;
  ThrowIfDbError(repository_->NextRunNumber(workflow_id, number), "NextRunNumber> workflow_id=" + std::to_string(workflow_id));
  return number;
}

void RunStore::InsertRun(db::Transaction& tx, model::WorkflowRun& run) {
  const auto context = "InsertRun> " + Keys(run);

  auto record = ToRecord(run, context);
  ThrowIfDbError(repository_->InsertRun(tx, record), context);
  run.id = record.id;

  for (auto& [node_id, attempts] : run.node_runs) {
    for (auto& attempt : attempts) {
      attempt.workflow_run_id = run.id;
      attempt.node_id         = node_id;
      InsertNodeRun(tx, attempt);
    }
  }
}

void RunStore::UpdateRun(db::Transaction& tx, model::WorkflowRun& run) {
  const auto context = "UpdateRun> " + Keys(run);

  run.last_modified_at = util::Now();
  if (HasErrorInfo(run)) {
    run.status = ::wfrun::v1::RUN_STATUS_FAIL;
  }

  ThrowIfDbError(repository_->UpdateRun(tx, ToRecord(run, context)), context);
}

model::WorkflowRun RunStore::LoadRun(const db::RunSelector& selector) {
  auto tx  = Begin(db::TransactionMode::kReadOnly);
  auto run = LoadRun(*tx, selector);
  tx->Commit();
  return run;
}

model::WorkflowRun RunStore::LoadRun(db::Transaction& tx, const db::RunSelector& selector) {
  const auto context = "LoadRun> " + selector.Describe();

  std::optional<db::model::RunRecord> record;
  ThrowIfDbError(repository_->FindRun(tx, selector, record), context);
  if (!record) {
    throw util::NotFound(context + ": run not found");
  }

  auto run = FromRecord(*record, context);

  // history arrives latest attempt first
  std::vector<db::model::NodeRunRecord> node_runs;
  ThrowIfDbError(repository_->ListNodeRuns(tx, run.id, node_runs), context + " node runs");
  for (const auto& node_run : node_runs) {
    run.node_runs[node_run.node_id].push_back(FromRecord(node_run));
  }
  for (auto& [_, attempts] : run.node_runs) {
    std::stable_sort(attempts.begin(), attempts.end(), [](const model::NodeRun& a, const model::NodeRun& b) { return a.sub_number > b.sub_number; });
  }

  LoadTags(*repository_, tx, run, context);
  return run;
}

RunPage RunStore::LoadRuns(const std::string& project_key, const std::string& workflow_name, std::size_t offset, std::size_t limit) {
  const auto context = "LoadRuns> project=" + project_key + " workflow=" + workflow_name;

  RunPage page;
  page.offset = offset;
  page.limit  = limit;

  auto tx = Begin(db::TransactionMode::kReadOnly);
  ThrowIfDbError(repository_->CountRuns(*tx, project_key, workflow_name, page.total), context + " count");
  if (page.total == 0) {
    tx->Commit();
    return page;
  }

  std::vector<db::model::RunRecord> records;
  ThrowIfDbError(repository_->ListRuns(*tx, project_key, workflow_name, db::Pagination{limit, offset}, records), context);

  page.runs.reserve(records.size());
  for (const auto& record : records) {
    auto run = FromRecord(record, context + " id=" + std::to_string(record.id));
    LoadTags(*repository_, *tx, run, context);
    page.runs.push_back(std::move(run));
  }

  tx->Commit();
  return page;
}

model::WorkflowRun RunStore::LoadAndLockRun(db::Transaction& tx, int64_t run_id) {
  ThrowIfDbError(repository_->LockRun(tx, run_id), "LoadAndLockRun> id=" + std::to_string(run_id));
  return LoadRun(tx, db::RunSelector::ById(run_id));
}

void RunStore::InsertNodeRun(db::Transaction& tx, model::NodeRun& node_run) {
  auto record = ToRecord(node_run);
  ThrowIfDbError(repository_->InsertNodeRun(tx, record), "InsertNodeRun> run_id=" + std::to_string(node_run.workflow_run_id) +
                                                             " node_id=" + std::to_string(node_run.node_id) +
                                                             " sub_number=" + std::to_string(node_run.sub_number));
  node_run.id = record.id;
}

void RunStore::UpdateNodeRun(db::Transaction& tx, const model::NodeRun& node_run) {
  ThrowIfDbError(repository_->UpdateNodeRun(tx, ToRecord(node_run)), "UpdateNodeRun> run_id=" + std::to_string(node_run.workflow_run_id) +
                                                                         " node_id=" + std::to_string(node_run.node_id) +
                                                                         " sub_number=" + std::to_string(node_run.sub_number));
}

} // namespace wfrun::store
