#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/engine/run_engine.hpp"
#include "internal/util/errors.hpp"

#if WFRUN_DB_SQLITE
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if WFRUN_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using wfrun::db::ErrorCode;
using wfrun::db::Pagination;
using wfrun::db::Repository;
using wfrun::db::RunSelector;
using wfrun::db::TransactionMode;
using wfrun::db::memory::MemoryRepository;
using wfrun::db::model::NodeRunRecord;
using wfrun::db::model::RunRecord;
using wfrun::db::model::RunTagRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  // a second independent repository on the same database; empty when the backend cannot share one
  std::function<std::shared_ptr<Repository>()>      make_peer_repository;
  // migrates a database that has never seen the schema; empty for memory
  std::function<std::shared_ptr<Repository>()>      make_fresh_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

// Keys unique per process run so a shared postgres database can be reused.
struct Scope {
  std::string project_key;
  std::string workflow_name;
  int64_t     workflow_id;
};

Scope MakeScope(const std::string& backend, const std::string& test) {
  static int64_t counter = 0;
  const auto     stamp   = static_cast<int64_t>(NowMs());
  return Scope{"P" + std::to_string(stamp), backend + "-" + test, stamp * 100 + (++counter)};
}

RunRecord MakeRun(const Scope& scope, int64_t number, uint64_t started_at_ms) {
  RunRecord record;
  record.workflow_id      = scope.workflow_id;
  record.project_id       = 7;
  record.project_key      = scope.project_key;
  record.workflow_name    = scope.workflow_name;
  record.number           = number;
  record.status           = wfrun::v1::RUN_STATUS_BUILDING;
  record.started_at_ms    = started_at_ms;
  record.last_modified_ms = started_at_ms;
  record.workflow_blob    = R"({"id":")" + std::to_string(scope.workflow_id) + R"(","name":")" + scope.workflow_name + R"("})";
  record.infos_blob       = R"({"infos":[]})";
  return record;
}

NodeRunRecord MakeNodeRun(int64_t run_id, int64_t node_id, int32_t sub_number) {
  NodeRunRecord record;
  record.workflow_run_id  = run_id;
  record.node_id          = node_id;
  record.sub_number       = sub_number;
  record.status           = wfrun::v1::RUN_STATUS_WAITING;
  record.started_at_ms    = NowMs();
  record.last_modified_ms = record.started_at_ms;
  return record;
}

void VerifyRunNumbering(Repository& repo, const Scope& scope) {
  int64_t first  = 0;
  int64_t second = 0;
  assert(repo.NextRunNumber(scope.workflow_id, first));
  assert(repo.NextRunNumber(scope.workflow_id, second));
  assert(first == 1);
  assert(second == 2);

  // numbering survives a rolled back caller transaction
  {
    auto    tx    = repo.Begin();
    int64_t third = 0;
    assert(repo.NextRunNumber(scope.workflow_id, third));
    assert(third == 3);
    tx->Rollback();
  }
  int64_t fourth = 0;
  assert(repo.NextRunNumber(scope.workflow_id, fourth));
  assert(fourth == 4);
}

void VerifyRunReadWrite(Repository& repo, const Scope& scope) {
  auto run = MakeRun(scope, 1, 1000);
  {
    auto tx = repo.Begin();
    assert(repo.InsertRun(*tx, run));
    assert(run.id > 0);

    std::optional<RunRecord> seen;
    assert(repo.FindRun(*tx, RunSelector::ById(run.id), seen));
    assert(seen.has_value());
    tx->Commit();
  }
  {
    auto tx = repo.Begin(TransactionMode::kReadOnly);

    std::optional<RunRecord> found;
    assert(repo.FindRun(*tx, RunSelector::ByNumber(scope.project_key, scope.workflow_name, 1), found));
    assert(found.has_value());
    assert(found->id == run.id);
    assert(found->workflow_id == scope.workflow_id);
    assert(found->project_key == scope.project_key);
    assert(found->status == wfrun::v1::RUN_STATUS_BUILDING);
    assert(found->started_at_ms == 1000);
    assert(!found->stop_requested);
    assert(found->workflow_blob.find(scope.workflow_name) != std::string::npos);

    assert(repo.FindRun(*tx, RunSelector::ByIdAndProject(scope.project_key, run.id), found));
    assert(found.has_value());

    assert(repo.FindRun(*tx, RunSelector::ByIdAndProject("OTHER", run.id), found));
    assert(!found.has_value());

    assert(repo.FindRun(*tx, RunSelector::ByNumber(scope.project_key, scope.workflow_name, 99), found));
    assert(!found.has_value());
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    assert(repo.LockRun(*tx, run.id));

    run.status           = wfrun::v1::RUN_STATUS_SUCCESS;
    run.stop_requested   = true;
    run.last_modified_ms = 2000;
    run.infos_blob       = R"({"infos":[{"message":"done"}]})";
    assert(repo.UpdateRun(*tx, run));
    tx->Commit();
  }
  {
    auto                     tx = repo.Begin(TransactionMode::kReadOnly);
    std::optional<RunRecord> found;
    assert(repo.FindRun(*tx, RunSelector::ById(run.id), found));
    assert(found.has_value());
    assert(found->status == wfrun::v1::RUN_STATUS_SUCCESS);
    assert(found->stop_requested);
    assert(found->last_modified_ms == 2000);
    assert(found->infos_blob.find("done") != std::string::npos);
    tx->Commit();
  }
  {
    auto tx        = repo.Begin();
    auto duplicate = MakeRun(scope, 1, 1500);
    auto result    = repo.InsertRun(*tx, duplicate);
    assert(!result);
    assert(result.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }
}

void VerifyRollbackDiscardsWrites(Repository& repo, const Scope& scope) {
  int64_t id = 0;
  {
    auto tx  = repo.Begin();
    auto run = MakeRun(scope, 1, 1000);
    assert(repo.InsertRun(*tx, run));
    id = run.id;
    tx->Rollback();
  }

  auto                     tx = repo.Begin(TransactionMode::kReadOnly);
  std::optional<RunRecord> found;
  assert(repo.FindRun(*tx, RunSelector::ById(id), found));
  assert(!found.has_value());
  tx->Commit();
}

void VerifyListingOrderAndPaging(Repository& repo, const Scope& scope) {
  {
    auto tx = repo.Begin();
    for (const auto& [number, started] : std::vector<std::pair<int64_t, uint64_t>>{{1, 1000}, {2, 3000}, {3, 2000}}) {
      auto run = MakeRun(scope, number, started);
      assert(repo.InsertRun(*tx, run));
    }
    tx->Commit();
  }

  auto tx = repo.Begin(TransactionMode::kReadOnly);

  int64_t count = 0;
  assert(repo.CountRuns(*tx, scope.project_key, scope.workflow_name, count));
  assert(count == 3);

  std::vector<RunRecord> runs;
  assert(repo.ListRuns(*tx, scope.project_key, scope.workflow_name, Pagination{10, 0}, runs));
  assert(runs.size() == 3);
  assert(runs[0].number == 2);
  assert(runs[1].number == 3);
  assert(runs[2].number == 1);

  assert(repo.ListRuns(*tx, scope.project_key, scope.workflow_name, Pagination{1, 1}, runs));
  assert(runs.size() == 1);
  assert(runs[0].number == 3);

  assert(repo.ListRuns(*tx, scope.project_key, scope.workflow_name, Pagination{10, 5}, runs));
  assert(runs.empty());

  std::optional<RunRecord> latest;
  assert(repo.FindRun(*tx, RunSelector::Latest(scope.project_key, scope.workflow_name), latest));
  assert(latest.has_value());
  assert(latest->number == 3);
  tx->Commit();
}

void VerifyNodeRunHistory(Repository& repo, const Scope& scope) {
  auto run = MakeRun(scope, 1, 1000);
  {
    auto tx = repo.Begin();
    assert(repo.InsertRun(*tx, run));

    for (const auto& [node_id, sub_number] : std::vector<std::pair<int64_t, int32_t>>{{1, 0}, {2, 0}, {1, 1}, {1, 2}}) {
      auto node_run = MakeNodeRun(run.id, node_id, sub_number);
      assert(repo.InsertNodeRun(*tx, node_run));
      assert(node_run.id > 0);
    }
    tx->Commit();
  }
  {
    auto tx = repo.Begin();

    std::vector<NodeRunRecord> history;
    assert(repo.ListNodeRuns(*tx, run.id, history));
    assert(history.size() == 4);
    for (size_t i = 1; i < history.size(); ++i) {
      assert(history[i - 1].sub_number >= history[i].sub_number);
    }
    assert(history[0].node_id == 1 && history[0].sub_number == 2);

    auto latest           = history[0];
    latest.status         = wfrun::v1::RUN_STATUS_SUCCESS;
    latest.finished_at_ms = 5000;
    assert(repo.UpdateNodeRun(*tx, latest));

    assert(repo.ListNodeRuns(*tx, run.id, history));
    assert(history[0].status == wfrun::v1::RUN_STATUS_SUCCESS);
    assert(history[0].finished_at_ms == 5000);
    tx->Commit();
  }
  {
    auto tx        = repo.Begin();
    auto duplicate = MakeNodeRun(run.id, 1, 1);
    auto result    = repo.InsertNodeRun(*tx, duplicate);
    assert(!result);
    assert(result.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }
}

void VerifyTagReplacement(Repository& repo, const Scope& scope) {
  auto first  = MakeRun(scope, 1, 1000);
  auto second = MakeRun(scope, 2, 2000);
  {
    auto tx = repo.Begin();
    assert(repo.InsertRun(*tx, first));
    assert(repo.InsertRun(*tx, second));
    assert(repo.InsertRunTags(*tx, {{first.id, "branch", "main"}, {first.id, "author", "alice"}}));
    assert(repo.InsertRunTags(*tx, {{second.id, "branch", "dev"}, {second.id, "author", "alice"}}));
    tx->Commit();
  }
  {
    // replace with the identical set, twice
    auto tx = repo.Begin();
    for (int i = 0; i < 2; ++i) {
      assert(repo.DeleteRunTags(*tx, first.id));
      assert(repo.InsertRunTags(*tx, {{first.id, "author", "alice"}, {first.id, "branch", "main"}}));
    }
    tx->Commit();
  }

  auto tx = repo.Begin(TransactionMode::kReadOnly);

  std::vector<RunTagRecord> tags;
  assert(repo.ListRunTags(*tx, first.id, tags));
  assert(tags.size() == 2);

  std::vector<RunTagRecord> values;
  assert(repo.ListWorkflowTagValues(*tx, scope.project_key, scope.workflow_name, values));
  assert(values.size() == 3);
  for (const auto& value : values) {
    assert(value.workflow_run_id == 0);
  }
  tx->Commit();
}

void VerifyLockConflict(Repository& repo, const Scope& scope) {
  auto run = MakeRun(scope, 1, 1000);
  {
    auto tx = repo.Begin();
    assert(repo.InsertRun(*tx, run));
    tx->Commit();
  }

  auto holder = repo.Begin();
  assert(repo.LockRun(*holder, run.id));
  // re-locking inside the holder is harmless
  assert(repo.LockRun(*holder, run.id));

  {
    const auto started = std::chrono::steady_clock::now();
    auto       other   = repo.Begin();
    auto       result  = repo.LockRun(*other, run.id);
    assert(!result);
    assert(result.code == ErrorCode::LockConflict);
    assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));
    other->Rollback();
  }

  holder->Commit();

  auto next = repo.Begin();
  assert(repo.LockRun(*next, run.id));
  next->Commit();

  auto missing = repo.Begin();
  auto result  = repo.LockRun(*missing, run.id + 100000);
  assert(!result);
  assert(result.code == ErrorCode::NotFound);
  missing->Rollback();
}

void VerifyEngineScenario(const std::shared_ptr<Repository>& repo, const Scope& scope) {
  wfrun::engine::RunEngine engine(std::make_shared<wfrun::store::RunStore>(repo), std::make_shared<wfrun::tags::TagIndexer>(repo));

  wfrun::v1::Workflow workflow;
  workflow.set_id(scope.workflow_id);
  workflow.set_name(scope.workflow_name);
  workflow.set_project_key(scope.project_key);
  for (int64_t id : {1, 2}) {
    auto* node = workflow.add_nodes();
    node->set_id(id);
    node->set_name("node-" + std::to_string(id));
  }

  wfrun::v1::TriggerContext main_trigger;
  main_trigger.set_branch("main");
  wfrun::v1::TriggerContext dev_trigger;
  dev_trigger.set_branch("dev");

  const auto first = engine.CreateRun(workflow, main_trigger);
  engine.CreateRun(workflow, dev_trigger);

  engine.AdvanceNode(first.id, 1, wfrun::v1::RUN_STATUS_FAIL);
  engine.AdvanceNode(first.id, 1, wfrun::v1::RUN_STATUS_BUILDING);

  const auto loaded = engine.LoadRun(scope.project_key, scope.workflow_name, 1);
  assert(loaded.node_runs.at(1).size() == 2);
  assert(loaded.node_runs.at(1)[0].sub_number == 1);
  assert(loaded.node_runs.at(1)[1].sub_number == 0);
  assert(loaded.workflow.nodes_size() == 2);

  engine.AdvanceNode(first.id, 1, wfrun::v1::RUN_STATUS_SUCCESS);
  const auto done = engine.AdvanceNode(first.id, 2, wfrun::v1::RUN_STATUS_SUCCESS);
  assert(done.status == wfrun::v1::RUN_STATUS_SUCCESS);

  assert(engine.LoadLastRun(scope.project_key, scope.workflow_name).number == 2);

  const auto values = engine.AggregateTagValues(scope.project_key, scope.workflow_name);
  assert((values.at("branch") == std::vector<std::string>{"dev", "main"}));
}

void VerifyLockAcrossRepositories(BackendFactory& backend, const Scope& scope) {
  if (!backend.make_peer_repository) {
    return;
  }

  auto repo = backend.make_repository();
  auto peer = backend.make_peer_repository();

  wfrun::engine::RunEngine engine(std::make_shared<wfrun::store::RunStore>(repo), std::make_shared<wfrun::tags::TagIndexer>(repo));
  wfrun::engine::RunEngine peer_engine(std::make_shared<wfrun::store::RunStore>(peer), std::make_shared<wfrun::tags::TagIndexer>(peer));

  wfrun::v1::Workflow workflow;
  workflow.set_id(scope.workflow_id);
  workflow.set_name(scope.workflow_name);
  workflow.set_project_key(scope.project_key);
  auto* node = workflow.add_nodes();
  node->set_id(1);
  node->set_name("build");

  const auto created = engine.CreateRun(workflow, wfrun::v1::TriggerContext{});

  {
    auto holder = repo->Begin();
    assert(repo->LockRun(*holder, created.id));

    const auto started = std::chrono::steady_clock::now();
    bool       refused = false;
    try {
      peer_engine.AdvanceNode(created.id, 1, wfrun::v1::RUN_STATUS_BUILDING);
    } catch (const wfrun::util::LockConflict&) {
      refused = true;
    }
    assert(refused);

    auto other  = peer->Begin();
    auto result = peer->LockRun(*other, created.id);
    assert(!result);
    assert(result.code == ErrorCode::LockConflict);
    other->Rollback();
    assert(std::chrono::steady_clock::now() - started < std::chrono::seconds(2));

    holder->Rollback();
  }

  auto run = peer_engine.AdvanceNode(created.id, 1, wfrun::v1::RUN_STATUS_BUILDING);
  assert(run.node_runs.at(1).front().status == wfrun::v1::RUN_STATUS_BUILDING);

  // the peer's commit released its claim
  run = engine.AdvanceNode(created.id, 1, wfrun::v1::RUN_STATUS_SUCCESS);
  assert(run.status == wfrun::v1::RUN_STATUS_SUCCESS);
  assert(peer_engine.LoadRunByID(created.id).status == wfrun::v1::RUN_STATUS_SUCCESS);
}

void VerifyMigrateOnEmptyDatabase(BackendFactory& backend, const Scope& scope) {
  if (!backend.make_fresh_repository) {
    return;
  }

  auto    repo   = backend.make_fresh_repository();
  int64_t number = 0;
  assert(repo->NextRunNumber(scope.workflow_id, number));
  assert(number == 1);

  auto run = MakeRun(scope, number, 1000);
  {
    auto tx = repo->Begin();
    assert(repo->InsertRun(*tx, run));
    assert(repo->LockRun(*tx, run.id));
    tx->Commit();
  }

  auto                     tx = repo->Begin(TransactionMode::kReadOnly);
  std::optional<RunRecord> found;
  assert(repo->FindRun(*tx, RunSelector::ById(run.id), found));
  assert(found.has_value());
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const Scope& scope) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  auto run  = MakeRun(scope, 1, 1000);
  {
    auto tx = repo->Begin();
    assert(repo->InsertRun(*tx, run));
    auto node_run = MakeNodeRun(run.id, 1, 0);
    assert(repo->InsertNodeRun(*tx, node_run));
    assert(repo->InsertRunTags(*tx, {{run.id, "branch", "main"}}));
    tx->Commit();
  }
  int64_t number = 0;
  assert(repo->NextRunNumber(scope.workflow_id, number));

  backend.restart(repo);

  auto                     tx = repo->Begin(TransactionMode::kReadOnly);
  std::optional<RunRecord> found;
  assert(repo->FindRun(*tx, RunSelector::ById(run.id), found));
  assert(found.has_value());

  std::vector<NodeRunRecord> history;
  assert(repo->ListNodeRuns(*tx, run.id, history));
  assert(history.size() == 1);

  std::vector<RunTagRecord> tags;
  assert(repo->ListRunTags(*tx, run.id, tags));
  assert(tags.size() == 1);
  tx->Commit();

  int64_t next = 0;
  assert(repo->NextRunNumber(scope.workflow_id, next));
  assert(next == number + 1);
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                  = "memory",
      .make_repository       = []() { return std::make_shared<MemoryRepository>(); },
      .make_peer_repository  = nullptr,
      .make_fresh_repository = nullptr,
      .supports_restart      = []() { return false; },
      .restart               = [](std::shared_ptr<Repository>&) {},
      .cleanup               = []() {},
  };
}

#if WFRUN_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path   = (std::filesystem::temp_directory_path() / ("wfrun_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();
  auto make_repo = [db_path]() {
    auto repo = std::make_shared<wfrun::db::sqlite::SqliteRepository>(db_path, 5000);
    repo->Migrate();
    return repo;
  };
  auto fresh_path = db_path + ".fresh";
  auto remove_db  = [](const std::string& path) {
    std::error_code ec;
    for (const auto* suffix : {"", "-wal", "-shm"}) {
      std::filesystem::remove(path + suffix, ec);
    }
  };

  return BackendFactory{
      .name                  = "sqlite",
      .make_repository       = make_repo,
      .make_peer_repository  = make_repo,
      .make_fresh_repository =
          [fresh_path, remove_db]() {
            remove_db(fresh_path);
            auto repo = std::make_shared<wfrun::db::sqlite::SqliteRepository>(fresh_path, 5000);
            repo->Migrate();
            return repo;
          },
      .supports_restart      = []() { return true; },
      .restart               = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup               =
          [db_path, fresh_path, remove_db]() {
            remove_db(db_path);
            remove_db(fresh_path);
          },
  };
}
#endif

#if WFRUN_DB_POSTGRES
// Points a conninfo (URI or key/value form) at one schema.
std::string WithSearchPath(const std::string& conninfo, const std::string& schema) {
  if (conninfo.find("://") == std::string::npos) {
    return conninfo + " options='-csearch_path=" + schema + "'";
  }
  return conninfo + (conninfo.find('?') == std::string::npos ? "?" : "&") + "options=-csearch_path%3D" + schema;
}

void ResetSchema(const std::string& conninfo, const std::string& schema, bool recreate) {
  pqxx::connection conn(conninfo);
  pqxx::work       work(conn);
  work.exec("DROP SCHEMA IF EXISTS " + schema + " CASCADE");
  if (recreate) {
    work.exec("CREATE SCHEMA " + schema);
  }
  work.commit();
}

std::optional<BackendFactory> MakePostgresFactory() {
  const char* uri = std::getenv("WFRUN_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    return std::nullopt;
  }

  const std::string conninfo = uri;
  const std::string fresh    = "wfrun_parity_fresh";

  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<wfrun::db::postgres::PgPool>(conninfo, 4);
    auto repo = std::make_shared<wfrun::db::postgres::PgRepository>(pool);
    repo->Migrate();
    return repo;
  };

  return BackendFactory{
      .name                  = "postgres",
      .make_repository       = make_repo,
      .make_peer_repository  = make_repo,
      .make_fresh_repository =
          [conninfo, fresh]() {
            ResetSchema(conninfo, fresh, true);
            auto pool = std::make_shared<wfrun::db::postgres::PgPool>(WithSearchPath(conninfo, fresh), 2);
            auto repo = std::make_shared<wfrun::db::postgres::PgRepository>(pool);
            repo->Migrate();
            return repo;
          },
      .supports_restart      = []() { return true; },
      .restart               = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup               = [conninfo, fresh]() { ResetSchema(conninfo, fresh, false); },
  };
}
#endif

void RunParitySuite(BackendFactory& backend) {
  {
    auto repo = backend.make_repository();
    VerifyRunNumbering(*repo, MakeScope(backend.name, "numbering"));
    VerifyRunReadWrite(*repo, MakeScope(backend.name, "read-write"));
    VerifyRollbackDiscardsWrites(*repo, MakeScope(backend.name, "rollback"));
    VerifyListingOrderAndPaging(*repo, MakeScope(backend.name, "listing"));
    VerifyNodeRunHistory(*repo, MakeScope(backend.name, "node-runs"));
    VerifyTagReplacement(*repo, MakeScope(backend.name, "tags"));
    VerifyLockConflict(*repo, MakeScope(backend.name, "locks"));
    VerifyEngineScenario(repo, MakeScope(backend.name, "engine"));
  }
  VerifyLockAcrossRepositories(backend, MakeScope(backend.name, "peer-locks"));
  VerifyMigrateOnEmptyDatabase(backend, MakeScope(backend.name, "fresh"));
  VerifyRestartDurability(backend, MakeScope(backend.name, "restart"));
  backend.cleanup();

  std::cout << "  " << backend.name << ": ok\n";
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());
#if WFRUN_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif
#if WFRUN_DB_POSTGRES
  if (auto postgres = MakePostgresFactory()) {
    backends.push_back(std::move(*postgres));
  } else {
    std::cout << "  postgres: skipped (WFRUN_TEST_POSTGRES_URI not set)\n";
  }
#endif

  for (auto& backend : backends) {
    RunParitySuite(backend);
  }

  std::cout << "wfrun_integration_repository_parity: pass\n";
  return 0;
}
