#include <atomic>
#include <cassert>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/engine/run_engine.hpp"
#include "internal/util/errors.hpp"

namespace {

using wfrun::db::ErrorCode;
using wfrun::db::Pagination;
using wfrun::db::Repository;
using wfrun::db::Result;
using wfrun::db::RunSelector;
using wfrun::db::Transaction;
using wfrun::db::TransactionMode;
using wfrun::db::memory::MemoryRepository;
using wfrun::engine::RunEngine;
namespace record = wfrun::db::model;

// Forwards to a memory repository; UpdateRun parks until released when armed.
class GatedRepository final : public Repository {
 public:
  void Arm() {
    std::lock_guard lock(mutex_);
    armed_   = true;
    parked_  = false;
    release_ = false;
  }

  void WaitUntilParked() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [&] { return parked_; });
  }

  void Release() {
    std::lock_guard lock(mutex_);
    release_ = true;
    cv_.notify_all();
  }

  std::unique_ptr<Transaction> Begin(TransactionMode mode) override {
    return inner_.Begin(mode);
  }
  Result NextRunNumber(int64_t workflow_id, int64_t& number) override {
    return inner_.NextRunNumber(workflow_id, number);
  }
  Result InsertRun(Transaction& tx, record::RunRecord& r) override {
    return inner_.InsertRun(tx, r);
  }
  Result UpdateRun(Transaction& tx, const record::RunRecord& r) override {
    {
      std::unique_lock lock(mutex_);
      if (armed_) {
        armed_  = false;
        parked_ = true;
        cv_.notify_all();
        cv_.wait(lock, [&] { return release_; });
      }
    }
    return inner_.UpdateRun(tx, r);
  }
  Result FindRun(Transaction& tx, const RunSelector& selector, std::optional<record::RunRecord>& out) override {
    return inner_.FindRun(tx, selector, out);
  }
  Result LockRun(Transaction& tx, int64_t run_id) override {
    return inner_.LockRun(tx, run_id);
  }
  Result CountRuns(Transaction& tx, const std::string& project_key, const std::string& workflow_name, int64_t& count) override {
    return inner_.CountRuns(tx, project_key, workflow_name, count);
  }
  Result ListRuns(Transaction& tx, const std::string& project_key, const std::string& workflow_name, const Pagination& pagination,
                  std::vector<record::RunRecord>& out) override {
    return inner_.ListRuns(tx, project_key, workflow_name, pagination, out);
  }
  Result InsertNodeRun(Transaction& tx, record::NodeRunRecord& r) override {
    return inner_.InsertNodeRun(tx, r);
  }
  Result UpdateNodeRun(Transaction& tx, const record::NodeRunRecord& r) override {
    return inner_.UpdateNodeRun(tx, r);
  }
  Result ListNodeRuns(Transaction& tx, int64_t run_id, std::vector<record::NodeRunRecord>& out) override {
    return inner_.ListNodeRuns(tx, run_id, out);
  }
  Result DeleteRunTags(Transaction& tx, int64_t run_id) override {
    return inner_.DeleteRunTags(tx, run_id);
  }
  Result InsertRunTags(Transaction& tx, const std::vector<record::RunTagRecord>& tags) override {
    return inner_.InsertRunTags(tx, tags);
  }
  Result ListRunTags(Transaction& tx, int64_t run_id, std::vector<record::RunTagRecord>& out) override {
    return inner_.ListRunTags(tx, run_id, out);
  }
  Result ListWorkflowTagValues(Transaction& tx, const std::string& project_key, const std::string& workflow_name,
                               std::vector<record::RunTagRecord>& out) override {
    return inner_.ListWorkflowTagValues(tx, project_key, workflow_name, out);
  }

 private:
  MemoryRepository inner_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    armed_   = false;
  bool                    parked_  = false;
  bool                    release_ = false;
};

wfrun::v1::Workflow TwoRoots() {
  wfrun::v1::Workflow workflow;
  workflow.set_id(43);
  workflow.set_name("TwoRoots");
  workflow.set_project_key("PROJ");
  for (int64_t id : {1, 2}) {
    auto* node = workflow.add_nodes();
    node->set_id(id);
    node->set_name("node-" + std::to_string(id));
  }
  return workflow;
}

RunEngine MakeEngine(const std::shared_ptr<Repository>& repository) {
  return RunEngine(std::make_shared<wfrun::store::RunStore>(repository), std::make_shared<wfrun::tags::TagIndexer>(repository));
}

void TestManyConcurrentCreatesGetDistinctNumbers() {
  auto repository = std::make_shared<MemoryRepository>();
  auto engine     = MakeEngine(repository);

  constexpr int        kRuns = 16;
  std::vector<int64_t> numbers(kRuns);
  std::vector<std::thread> threads;
  for (int i = 0; i < kRuns; ++i) {
    threads.emplace_back([&, i] { numbers[i] = engine.CreateRun(TwoRoots(), {}).number; });
  }
  for (auto& thread : threads) thread.join();

  const std::set<int64_t> distinct(numbers.begin(), numbers.end());
  assert(distinct.size() == kRuns);
  assert(*distinct.begin() == 1);
  assert(*distinct.rbegin() == kRuns);

  assert(engine.LoadRuns("PROJ", "TwoRoots", 0, 100).total == kRuns);
}

void TestSecondAdvanceConflictsWhileFirstIsInFlight() {
  auto repository = std::make_shared<GatedRepository>();
  auto engine     = MakeEngine(repository);

  const auto created = engine.CreateRun(TwoRoots(), {});

  repository->Arm();
  std::thread first([&] { engine.AdvanceNode(created.id, 1, wfrun::v1::RUN_STATUS_SUCCESS); });
  repository->WaitUntilParked();

  bool conflicted = false;
  try {
    engine.AdvanceNode(created.id, 2, wfrun::v1::RUN_STATUS_SUCCESS);
  } catch (const wfrun::util::LockConflict&) {
    conflicted = true;
  }
  assert(conflicted);

  repository->Release();
  first.join();

  // the refused mutation left nothing behind; retrying now succeeds
  auto run = engine.LoadRunByID(created.id);
  assert(run.node_runs.at(1).front().status == wfrun::v1::RUN_STATUS_SUCCESS);
  assert(run.node_runs.at(2).front().status == wfrun::v1::RUN_STATUS_WAITING);

  run = engine.AdvanceNode(created.id, 2, wfrun::v1::RUN_STATUS_SUCCESS);
  assert(run.status == wfrun::v1::RUN_STATUS_SUCCESS);
}

void TestConcurrentReportersNeverLoseUpdates() {
  auto repository = std::make_shared<MemoryRepository>();
  auto engine     = MakeEngine(repository);

  const auto created = engine.CreateRun(TwoRoots(), {});

  std::atomic<int> conflicts{0};
  auto report = [&](int64_t node_id) {
    for (;;) {
      try {
        engine.AdvanceNode(created.id, node_id, wfrun::v1::RUN_STATUS_SUCCESS);
        return;
      } catch (const wfrun::util::LockConflict&) {
        conflicts.fetch_add(1);
        std::this_thread::yield();
      }
    }
  };

  std::thread first(report, 1);
  std::thread second(report, 2);
  first.join();
  second.join();

  const auto run = engine.LoadRunByID(created.id);
  assert(run.node_runs.at(1).front().status == wfrun::v1::RUN_STATUS_SUCCESS);
  assert(run.node_runs.at(2).front().status == wfrun::v1::RUN_STATUS_SUCCESS);
  assert(run.status == wfrun::v1::RUN_STATUS_SUCCESS);
}

} // namespace

int main() {
  TestManyConcurrentCreatesGetDistinctNumbers();
  TestSecondAdvanceConflictsWhileFirstIsInFlight();
  TestConcurrentReportersNeverLoseUpdates();

  std::cout << "wfrun_unit_run_engine_concurrency: pass\n";
  return 0;
}
