#include "run_engine.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string_view>

#include "internal/db/api/types.hpp"
#include "internal/engine/status_aggregator.hpp"
#include "internal/engine/workflow_validator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace wfrun::engine {

namespace {

using observability::IntField;
using observability::Metrics;
using observability::Outcome;
using observability::StringField;

double ElapsedMs(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

// Span, metrics and one log line per failure class around an engine operation.
template <typename Fn>
auto ObserveOperation(std::string_view operation, int64_t run_id, Fn&& fn) {
  observability::OperationSpan span(operation, run_id);
  const auto                   started_at = std::chrono::steady_clock::now();

  auto finish = [&](Outcome outcome, std::string_view error = {}) {
    span.End(outcome, error);
    Metrics::Instance().RecordOperation(operation, outcome, ElapsedMs(started_at));
  };

  try {
    auto result = fn();
    finish(Outcome::kOk);
    return result;
  } catch (const util::LockConflict& ex) {
    // recoverable; retry policy belongs to the caller
    WFRUN_LOG_DEBUG("run locked by another mutation", {StringField("operation", operation), IntField("run_id", run_id)});
    finish(Outcome::kLockConflict, ex.what());
    throw;
  } catch (const util::NotFound& ex) {
    WFRUN_LOG_DEBUG("run not found", {StringField("operation", operation), StringField("error", ex.what())});
    finish(Outcome::kNotFound, ex.what());
    throw;
  } catch (const util::ValidationError& ex) {
    WFRUN_LOG_WARN("engine operation rejected", {StringField("operation", operation), IntField("run_id", run_id), StringField("error", ex.what())});
    finish(Outcome::kRejected, ex.what());
    throw;
  } catch (const std::exception& ex) {
    WFRUN_LOG_ERROR("engine operation failed", {StringField("operation", operation), IntField("run_id", run_id), StringField("error", ex.what())});
    finish(Outcome::kFailed, ex.what());
    throw;
  }
}

bool IsNodeStatus(model::Status status) {
  return status == ::wfrun::v1::RUN_STATUS_WAITING || status == ::wfrun::v1::RUN_STATUS_BUILDING || model::IsTerminal(status);
}

model::NodeRun NewAttempt(int64_t run_id, int64_t node_id, int32_t sub_number, model::Status status, util::TimePoint now) {
  model::NodeRun attempt;
  attempt.workflow_run_id  = run_id;
  attempt.node_id          = node_id;
  attempt.sub_number       = sub_number;
  attempt.status           = status;
  attempt.started_at       = now;
  attempt.last_modified_at = now;
  if (model::IsTerminal(status)) {
    attempt.finished_at = now;
  }
  return attempt;
}

const model::NodeRun* LatestAttempt(const model::WorkflowRun& run, int64_t node_id) {
  auto it = run.node_runs.find(node_id);
  if (it == run.node_runs.end() || it->second.empty()) return nullptr;
  return &it->second.front();
}

::wfrun::v1::RunInfo MakeInfo(const std::string& message, bool is_error, int64_t node_id, util::TimePoint now) {
  ::wfrun::v1::RunInfo info;
  info.set_message(message);
  info.set_is_error(is_error);
  info.set_node_id(node_id);
  *info.mutable_created() = util::ToProto(now);
  return info;
}

std::string RunContext(const char* operation, int64_t run_id) {
  return std::string(operation) + "> id=" + std::to_string(run_id);
}

} // namespace

RunEngine::RunEngine(std::shared_ptr<store::RunStore> store, std::shared_ptr<tags::TagIndexer> tags, std::shared_ptr<NodeDispatcher> dispatcher,
                     EngineOptions options)
    : store_(std::move(store)), tags_(std::move(tags)), dispatcher_(std::move(dispatcher)), options_(options) {
  if (!store_ || !tags_) {
    throw std::invalid_argument("run engine requires a run store and a tag indexer");
  }
  if (options_.default_page_limit == 0) options_.default_page_limit = 50;
  if (options_.max_page_limit < options_.default_page_limit) options_.max_page_limit = options_.default_page_limit;
}

model::WorkflowRun RunEngine::CreateRun(const ::wfrun::v1::Workflow& workflow, const ::wfrun::v1::TriggerContext& trigger) {
  auto run = ObserveOperation("RunEngine.CreateRun", 0, [&] {
    ValidateWorkflow(workflow);
    ValidateTrigger(trigger);

    model::WorkflowRun created;
    created.number        = store_->NextRunNumber(workflow.id());
    created.workflow_id   = workflow.id();
    created.project_id    = workflow.project_id();
    created.project_key   = workflow.project_key();
    created.workflow_name = workflow.name();
    created.workflow      = workflow;
    created.status        = ::wfrun::v1::RUN_STATUS_BUILDING;

    const auto now           = util::Now();
    created.started_at       = now;
    created.last_modified_at = now;

    for (const auto node_id : RootNodeIds(workflow)) {
      created.node_runs[node_id].push_back(NewAttempt(0, node_id, 0, ::wfrun::v1::RUN_STATUS_WAITING, now));
    }
    created.tags = tags::TagIndexer::Derive(trigger);

    auto tx = store_->Begin();
    store_->InsertRun(*tx, created);
    tags_->DeriveAndReplace(*tx, created);
    tx->Commit();
    return created;
  });

  Metrics::Instance().RecordRunCreated(run.project_key);
  WFRUN_LOG_INFO("workflow run created", {StringField("project", run.project_key), StringField("workflow", run.workflow_name),
                                          IntField("run_id", run.id), IntField("number", run.number)});

  std::vector<model::NodeRun> ready;
  for (const auto& [_, attempts] : run.node_runs) {
    ready.push_back(attempts.front());
  }
  Dispatch(run, ready);
  return run;
}

model::WorkflowRun RunEngine::AdvanceNode(int64_t run_id, int64_t node_id, model::Status status, const std::vector<::wfrun::v1::RunInfo>& infos) {
  std::vector<model::NodeRun> ready;

  auto run = ObserveOperation("RunEngine.AdvanceNode", run_id, [&] {
    const auto context = RunContext("AdvanceNode", run_id) + " node=" + std::to_string(node_id);
    if (!IsNodeStatus(status)) {
      throw util::ValidationError(context + ": invalid node status " + model::ToString(status));
    }

    auto tx      = store_->Begin();
    auto current = store_->LoadAndLockRun(*tx, run_id);

    if (model::IsTerminal(current.status)) {
      throw util::ValidationError(context + ": run is " + model::ToString(current.status) + " and can no longer change");
    }
    if (FindNode(current.workflow, node_id) == nullptr) {
      throw util::ValidationError(context + ": node is not part of the workflow");
    }

    const auto now      = util::Now();
    auto&      attempts = current.node_runs[node_id];
    if (!attempts.empty() && !model::IsTerminal(attempts.front().status)) {
      auto& latest            = attempts.front();
      latest.status           = status;
      latest.last_modified_at = now;
      if (model::IsTerminal(status)) {
        latest.finished_at = now;
      }
      store_->UpdateNodeRun(*tx, latest);
    } else {
      const int32_t sub_number = attempts.empty() ? 0 : attempts.front().sub_number + 1;
      auto          attempt    = NewAttempt(current.id, node_id, sub_number, status, now);
      store_->InsertNodeRun(*tx, attempt);
      attempts.insert(attempts.begin(), attempt);
      // a re-triggered node is scheduled like a fresh child
      if (status == ::wfrun::v1::RUN_STATUS_WAITING) {
        ready.push_back(attempt);
      }
    }

    for (auto info : infos) {
      if (info.node_id() == 0) info.set_node_id(node_id);
      if (!info.has_created()) *info.mutable_created() = util::ToProto(now);
      current.infos.push_back(std::move(info));
    }

    if (status == ::wfrun::v1::RUN_STATUS_SUCCESS) {
      for (const auto child_id : ChildNodeIds(current.workflow, node_id)) {
        if (LatestAttempt(current, child_id) != nullptr) continue;

        const auto* child   = FindNode(current.workflow, child_id);
        bool        runnable = true;
        for (const auto parent_id : child->parent_ids()) {
          const auto* parent = LatestAttempt(current, parent_id);
          if (parent == nullptr || parent->status != ::wfrun::v1::RUN_STATUS_SUCCESS) {
            runnable = false;
            break;
          }
        }
        if (!runnable) continue;

        auto attempt = NewAttempt(current.id, child_id, 0, ::wfrun::v1::RUN_STATUS_WAITING, now);
        store_->InsertNodeRun(*tx, attempt);
        current.node_runs[child_id].push_back(attempt);
        ready.push_back(attempt);
      }
    }

    current.status = ComputeRunStatus(current);
    store_->UpdateRun(*tx, current);
    tags_->DeriveAndReplace(*tx, current);
    tx->Commit();
    return current;
  });

  Metrics::Instance().RecordNodeAdvance(model::ToString(status));
  WFRUN_LOG_DEBUG("node advanced", {IntField("run_id", run_id), IntField("node_id", node_id), StringField("node_status", model::ToString(status)),
                                    StringField("run_status", model::ToString(run.status))});
  if (model::IsTerminal(run.status)) {
    WFRUN_LOG_INFO("workflow run finished", {StringField("project", run.project_key), StringField("workflow", run.workflow_name),
                                             IntField("number", run.number), StringField("status", model::ToString(run.status))});
  }

  Dispatch(run, ready);
  return run;
}

model::WorkflowRun RunEngine::StopRun(int64_t run_id, const std::string& actor) {
  return ObserveOperation("RunEngine.StopRun", run_id, [&] {
    auto tx  = store_->Begin();
    auto run = store_->LoadAndLockRun(*tx, run_id);

    if (model::IsTerminal(run.status)) {
      throw util::ValidationError(RunContext("StopRun", run_id) + ": run is " + model::ToString(run.status) + " and can no longer change");
    }

    const auto now     = util::Now();
    run.stop_requested = true;
    for (auto& [_, attempts] : run.node_runs) {
      if (attempts.empty() || model::IsTerminal(attempts.front().status)) continue;

      auto& latest            = attempts.front();
      latest.status           = ::wfrun::v1::RUN_STATUS_STOPPED;
      latest.finished_at      = now;
      latest.last_modified_at = now;
      store_->UpdateNodeRun(*tx, latest);
    }

    run.infos.push_back(MakeInfo(actor.empty() ? "Workflow run stopped" : "Workflow run stopped by " + actor, false, 0, now));

    run.status = ComputeRunStatus(run);
    store_->UpdateRun(*tx, run);
    tags_->DeriveAndReplace(*tx, run);
    tx->Commit();

    WFRUN_LOG_INFO("workflow run stopped", {IntField("run_id", run_id), StringField("actor", actor), StringField("status", model::ToString(run.status))});
    return run;
  });
}

model::WorkflowRun RunEngine::LoadLastRun(const std::string& project_key, const std::string& workflow_name) {
  return ObserveOperation("RunEngine.LoadLastRun", 0, [&] { return store_->LoadRun(db::RunSelector::Latest(project_key, workflow_name)); });
}

model::WorkflowRun RunEngine::LoadRun(const std::string& project_key, const std::string& workflow_name, int64_t number) {
  return ObserveOperation("RunEngine.LoadRun", 0, [&] { return store_->LoadRun(db::RunSelector::ByNumber(project_key, workflow_name, number)); });
}

model::WorkflowRun RunEngine::LoadRunByID(int64_t run_id) {
  return ObserveOperation("RunEngine.LoadRunByID", run_id, [&] { return store_->LoadRun(db::RunSelector::ById(run_id)); });
}

model::WorkflowRun RunEngine::LoadRunByIDAndProjectKey(const std::string& project_key, int64_t run_id) {
  return ObserveOperation("RunEngine.LoadRunByIDAndProjectKey", run_id,
                          [&] { return store_->LoadRun(db::RunSelector::ByIdAndProject(project_key, run_id)); });
}

store::RunPage RunEngine::LoadRuns(const std::string& project_key, const std::string& workflow_name, int64_t offset, int64_t limit) {
  return ObserveOperation("RunEngine.LoadRuns", 0, [&] {
    if (offset < 0) {
      throw util::ValidationError("LoadRuns> project=" + project_key + " workflow=" + workflow_name + ": offset must not be negative");
    }

    std::size_t page_limit = limit <= 0 ? options_.default_page_limit : static_cast<std::size_t>(limit);
    page_limit             = std::min(page_limit, options_.max_page_limit);
    return store_->LoadRuns(project_key, workflow_name, static_cast<std::size_t>(offset), page_limit);
  });
}

std::map<std::string, std::vector<std::string>> RunEngine::AggregateTagValues(const std::string& project_key, const std::string& workflow_name) {
  return ObserveOperation("RunEngine.AggregateTagValues", 0, [&] { return tags_->AggregateValues(project_key, workflow_name); });
}

void RunEngine::Dispatch(const model::WorkflowRun& run, const std::vector<model::NodeRun>& ready) {
  if (!dispatcher_) return;

  for (const auto& node_run : ready) {
    try {
      dispatcher_->NodeReady(run, node_run);
    } catch (const std::exception& ex) {
      // the mutation is committed; the node stays Waiting for a later dispatch
      WFRUN_LOG_ERROR("node dispatch failed", {IntField("run_id", run.id), IntField("node_id", node_run.node_id), StringField("error", ex.what())});
    }
  }
}

} // namespace wfrun::engine
