#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace wfrun::db::memory {

namespace {

bool SameWorkflow(const model::RunRecord& r, const std::string& project_key, const std::string& workflow_name) {
  return r.project_key == project_key && r.workflow_name == workflow_name;
}

bool Matches(const model::RunRecord& r, const RunSelector& selector) {
  switch (selector.kind) {
    case RunSelector::Kind::kByNumber:
      return SameWorkflow(r, selector.project_key, selector.workflow_name) && r.number == selector.number;
    case RunSelector::Kind::kLatest:
      return SameWorkflow(r, selector.project_key, selector.workflow_name);
    case RunSelector::Kind::kById:
      return r.id == selector.run_id;
    case RunSelector::Kind::kByIdAndProject:
      return r.id == selector.run_id && r.project_key == selector.project_key;
  }
  return false;
}

Result ReadOnlyViolation() {
  return Result::Err(ErrorCode::InternalError, "write in read-only transaction");
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin(TransactionMode mode) {
  return std::make_unique<MemoryTransaction>(*this, mode);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::NextRunNumber(int64_t workflow_id, int64_t& number) {
  std::lock_guard lock(sequence_mutex_);
  number = ++sequences_[workflow_id];
  return Result::Ok();
}

// ------------------------------------------------------------------
// Runs
// ------------------------------------------------------------------

Result MemoryRepository::InsertRun(Transaction& t, model::RunRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyViolation();

  for (const auto& [_, existing] : tx.View().runs) {
    if (existing.workflow_id == r.workflow_id && existing.number == r.number) {
      return Result::Err(ErrorCode::AlreadyExists, "duplicate run number " + std::to_string(r.number));
    }
  }

  r.id = next_run_id_.fetch_add(1);
  tx.Apply([r](State& s) { s.runs[r.id] = r; });
  return Result::Ok();
}

Result MemoryRepository::UpdateRun(Transaction& t, const model::RunRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyViolation();
  if (!tx.View().runs.contains(r.id)) return Result::Err(ErrorCode::NotFound, "run " + std::to_string(r.id));

  tx.Apply([r](State& s) {
    if (auto it = s.runs.find(r.id); it != s.runs.end()) it->second = r;
  });
  return Result::Ok();
}

Result MemoryRepository::FindRun(Transaction& t, const RunSelector& selector, std::optional<model::RunRecord>& out) {
  out.reset();
  for (const auto& [_, r] : TX(t).View().runs) {
    if (!Matches(r, selector)) continue;
    if (!out || r.number > out->number) out = r;
    if (selector.kind != RunSelector::Kind::kLatest) break;
  }
  return Result::Ok();
}

Result MemoryRepository::LockRun(Transaction& t, int64_t run_id) {
  auto& tx = TX(t);
  if (!row_locks_.TryAcquire(run_id, tx.Id())) {
    return Result::Err(ErrorCode::LockConflict, "run " + std::to_string(run_id) + " is locked");
  }

  // the snapshot predates the lock; pick up whatever the previous holder committed
  tx.Refresh();
  if (!tx.View().runs.contains(run_id)) {
    return Result::Err(ErrorCode::NotFound, "run " + std::to_string(run_id));
  }
  return Result::Ok();
}

Result MemoryRepository::CountRuns(Transaction& t, const std::string& project_key, const std::string& workflow_name, int64_t& count) {
  count = 0;
  for (const auto& [_, r] : TX(t).View().runs) {
    if (SameWorkflow(r, project_key, workflow_name)) ++count;
  }
  return Result::Ok();
}

Result MemoryRepository::ListRuns(Transaction& t, const std::string& project_key, const std::string& workflow_name, const Pagination& pagination,
                                  std::vector<model::RunRecord>& out) {
  out.clear();
  std::vector<model::RunRecord> matching;
  for (const auto& [_, r] : TX(t).View().runs) {
    if (SameWorkflow(r, project_key, workflow_name)) matching.push_back(r);
  }

  std::sort(matching.begin(), matching.end(), [](const model::RunRecord& a, const model::RunRecord& b) {
    if (a.started_at_ms != b.started_at_ms) return a.started_at_ms > b.started_at_ms;
    return a.id > b.id;
  });

  for (std::size_t i = pagination.offset; i < matching.size() && out.size() < pagination.limit; ++i) {
    out.push_back(std::move(matching[i]));
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Node runs
// ------------------------------------------------------------------

Result MemoryRepository::InsertNodeRun(Transaction& t, model::NodeRunRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyViolation();
  if (!tx.View().runs.contains(r.workflow_run_id)) {
    return Result::Err(ErrorCode::ConstraintViolation, "unknown run " + std::to_string(r.workflow_run_id));
  }
  for (const auto& [_, existing] : tx.View().node_runs) {
    if (existing.workflow_run_id == r.workflow_run_id && existing.node_id == r.node_id && existing.sub_number == r.sub_number) {
      return Result::Err(ErrorCode::AlreadyExists, "node run exists");
    }
  }

  r.id = next_node_run_id_.fetch_add(1);
  tx.Apply([r](State& s) { s.node_runs[r.id] = r; });
  return Result::Ok();
}

Result MemoryRepository::UpdateNodeRun(Transaction& t, const model::NodeRunRecord& r) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyViolation();
  if (!tx.View().node_runs.contains(r.id)) return Result::Err(ErrorCode::NotFound, "node run " + std::to_string(r.id));

  tx.Apply([r](State& s) {
    if (auto it = s.node_runs.find(r.id); it != s.node_runs.end()) it->second = r;
  });
  return Result::Ok();
}

Result MemoryRepository::ListNodeRuns(Transaction& t, int64_t run_id, std::vector<model::NodeRunRecord>& out) {
  out.clear();
  for (const auto& [_, r] : TX(t).View().node_runs) {
    if (r.workflow_run_id == run_id) out.push_back(r);
  }
  std::stable_sort(out.begin(), out.end(), [](const model::NodeRunRecord& a, const model::NodeRunRecord& b) { return a.sub_number > b.sub_number; });
  return Result::Ok();
}

// ------------------------------------------------------------------
// Tags
// ------------------------------------------------------------------

Result MemoryRepository::DeleteRunTags(Transaction& t, int64_t run_id) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyViolation();

  tx.Apply([run_id](State& s) {
    for (auto it = s.tags.begin(); it != s.tags.end();) {
      if (std::get<0>(*it) == run_id) {
        it = s.tags.erase(it);
        continue;
      }
      ++it;
    }
  });
  return Result::Ok();
}

Result MemoryRepository::InsertRunTags(Transaction& t, const std::vector<model::RunTagRecord>& tags) {
  auto& tx = TX(t);
  if (tx.ReadOnly()) return ReadOnlyViolation();

  for (const auto& tag : tags) {
    if (tx.View().tags.contains(std::make_tuple(tag.workflow_run_id, tag.tag, tag.value))) {
      return Result::Err(ErrorCode::AlreadyExists, "tag " + tag.tag + "=" + tag.value);
    }
  }

  tx.Apply([tags](State& s) {
    for (const auto& tag : tags) {
      s.tags.emplace(tag.workflow_run_id, tag.tag, tag.value);
    }
  });
  return Result::Ok();
}

Result MemoryRepository::ListRunTags(Transaction& t, int64_t run_id, std::vector<model::RunTagRecord>& out) {
  out.clear();
  for (const auto& [id, tag, value] : TX(t).View().tags) {
    if (id == run_id) out.push_back({id, tag, value});
  }
  return Result::Ok();
}

Result MemoryRepository::ListWorkflowTagValues(Transaction& t, const std::string& project_key, const std::string& workflow_name,
                                               std::vector<model::RunTagRecord>& out) {
  out.clear();
  const auto& s = TX(t).View();

  std::set<std::pair<std::string, std::string>> distinct;
  for (const auto& [id, tag, value] : s.tags) {
    auto run = s.runs.find(id);
    if (run == s.runs.end() || !SameWorkflow(run->second, project_key, workflow_name)) continue;
    distinct.emplace(tag, value);
  }

  for (const auto& [tag, value] : distinct) {
    out.push_back({0, tag, value});
  }
  return Result::Ok();
}

} // namespace wfrun::db::memory
