#include "pg_repository.hpp"

#include <optional>

#include "internal/db/sql/migrations.hpp"

namespace wfrun::db::postgres {

namespace {

constexpr const char* kRunColumns =
    "id,workflow_id,project_id,project_key,workflow_name,num,status,stop_requested,start_ms,last_modified_ms,workflow::text,infos::text";

class WorkMigrationExecutor final : public sql::MigrationExecutor {
 public:
  explicit WorkMigrationExecutor(pqxx::work& work) : work_(work) {
  }

  void ExecuteSQL(const std::string& sql) override {
    work_.exec(sql);
  }

 private:
  pqxx::work& work_;
};

// empty blob -> NULL column
std::optional<std::string> Blob(const std::string& value) {
  if (value.empty()) return std::nullopt;
  return value;
}

model::RunRecord ReadRun(const pqxx::row& row) {
  model::RunRecord r;
  r.id               = row[0].as<int64_t>();
  r.workflow_id      = row[1].as<int64_t>();
  r.project_id       = row[2].as<int64_t>();
  r.project_key      = row[3].c_str();
  r.workflow_name    = row[4].c_str();
  r.number           = row[5].as<int64_t>();
  r.status           = row[6].as<int32_t>();
  r.stop_requested   = row[7].as<bool>();
  r.started_at_ms    = row[8].as<uint64_t>();
  r.last_modified_ms = row[9].as<uint64_t>();
  r.workflow_blob    = row[10].is_null() ? "" : row[10].c_str();
  r.infos_blob       = row[11].is_null() ? "" : row[11].c_str();
  return r;
}

model::NodeRunRecord ReadNodeRun(const pqxx::row& row) {
  model::NodeRunRecord r;
  r.id               = row[0].as<int64_t>();
  r.workflow_run_id  = row[1].as<int64_t>();
  r.node_id          = row[2].as<int64_t>();
  r.sub_number       = row[3].as<int32_t>();
  r.status           = row[4].as<int32_t>();
  r.started_at_ms    = row[5].as<uint64_t>();
  r.finished_at_ms   = row[6].as<uint64_t>();
  r.last_modified_ms = row[7].as<uint64_t>();
  return r;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgRepository::Migrate() {
  // pooled connections prepare statements against tables that may not exist yet
  auto       conn = pool_->Connect();
  pqxx::work tx(*conn);

  WorkMigrationExecutor executor(tx);
  sql::RunMigrations(executor, sql::PostgresSchema());
  tx.commit();
}

std::unique_ptr<db::Transaction> PgRepository::Begin(TransactionMode mode) {
  return std::make_unique<PgTransaction>(pool_, mode);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (const auto* sql_error = dynamic_cast<const pqxx::sql_error*>(&e)) {
    const std::string state = sql_error->sqlstate();
    if (state == "55P03") return Result::Err(ErrorCode::LockConflict, e.what());
    if (state == "23505") return Result::Err(ErrorCode::AlreadyExists, e.what());
    if (state.rfind("23", 0) == 0) return Result::Err(ErrorCode::ConstraintViolation, e.what());
    if (state == "40001" || state == "40P01") return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e) != nullptr) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::NextRunNumber(int64_t workflow_id, int64_t& number) {
  try {
    auto       conn = pool_->Acquire();
    pqxx::work w(*conn);
    auto       res = w.exec_prepared("next_run_number", workflow_id);
    number         = res[0][0].as<int64_t>();
    w.commit();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertRun(Transaction& t, model::RunRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO workflow_run(workflow_id,project_id,project_key,workflow_name,num,status,stop_requested,start_ms,last_modified_ms,workflow,infos) "
        "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10::jsonb,$11::jsonb) RETURNING id;",
        r.workflow_id, r.project_id, r.project_key, r.workflow_name, r.number, r.status, r.stop_requested, r.started_at_ms, r.last_modified_ms,
        Blob(r.workflow_blob), Blob(r.infos_blob));
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateRun(Transaction& t, const model::RunRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "UPDATE workflow_run SET workflow_id=$2,project_id=$3,project_key=$4,workflow_name=$5,num=$6,status=$7,stop_requested=$8,"
        "start_ms=$9,last_modified_ms=$10,workflow=$11::jsonb,infos=$12::jsonb WHERE id=$1;",
        r.id, r.workflow_id, r.project_id, r.project_key, r.workflow_name, r.number, r.status, r.stop_requested, r.started_at_ms, r.last_modified_ms,
        Blob(r.workflow_blob), Blob(r.infos_blob));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "run " + std::to_string(r.id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::FindRun(Transaction& t, const RunSelector& selector, std::optional<model::RunRecord>& out) {
  out.reset();
  try {
    auto&         work = TX(t).Work();
    const std::string select = std::string("SELECT ") + kRunColumns + " FROM workflow_run WHERE ";

    pqxx::result res;
    switch (selector.kind) {
      case RunSelector::Kind::kByNumber:
        res = work.exec_params(select + "project_key=$1 AND workflow_name=$2 AND num=$3;", selector.project_key, selector.workflow_name,
                               selector.number);
        break;
      case RunSelector::Kind::kLatest:
        res = work.exec_params(select + "project_key=$1 AND workflow_name=$2 ORDER BY num DESC LIMIT 1;", selector.project_key,
                               selector.workflow_name);
        break;
      case RunSelector::Kind::kById:
        res = work.exec_prepared("find_run_by_id", selector.run_id);
        break;
      case RunSelector::Kind::kByIdAndProject:
        res = work.exec_params(select + "project_key=$1 AND id=$2;", selector.project_key, selector.run_id);
        break;
    }

    if (!res.empty()) out = ReadRun(res[0]);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::LockRun(Transaction& t, int64_t run_id) {
  try {
    auto res = TX(t).Work().exec_prepared("lock_run", run_id);
    if (res.empty()) return Result::Err(ErrorCode::NotFound, "run " + std::to_string(run_id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::CountRuns(Transaction& t, const std::string& project_key, const std::string& workflow_name, int64_t& count) {
  try {
    auto res = TX(t).Work().exec_params("SELECT COUNT(1) FROM workflow_run WHERE project_key=$1 AND workflow_name=$2;", project_key, workflow_name);
    count    = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ListRuns(Transaction& t, const std::string& project_key, const std::string& workflow_name, const Pagination& pagination,
                              std::vector<model::RunRecord>& out) {
  out.clear();
  try {
    auto res = TX(t).Work().exec_params(std::string("SELECT ") + kRunColumns +
                                            " FROM workflow_run WHERE project_key=$1 AND workflow_name=$2"
                                            " ORDER BY start_ms DESC, id DESC LIMIT $3 OFFSET $4;",
                                        project_key, workflow_name, static_cast<int64_t>(pagination.limit), static_cast<int64_t>(pagination.offset));
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadRun(row));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertNodeRun(Transaction& t, model::NodeRunRecord& r) {
  try {
    auto res = TX(t).Work().exec_params(
        "INSERT INTO workflow_node_run(workflow_run_id,workflow_node_id,sub_num,status,start_ms,done_ms,last_modified_ms) "
        "VALUES($1,$2,$3,$4,$5,$6,$7) RETURNING id;",
        r.workflow_run_id, r.node_id, r.sub_number, r.status, r.started_at_ms, r.finished_at_ms, r.last_modified_ms);
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateNodeRun(Transaction& t, const model::NodeRunRecord& r) {
  try {
    auto res = TX(t).Work().exec_params("UPDATE workflow_node_run SET status=$2,start_ms=$3,done_ms=$4,last_modified_ms=$5 WHERE id=$1;", r.id,
                                        r.status, r.started_at_ms, r.finished_at_ms, r.last_modified_ms);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "node run " + std::to_string(r.id));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ListNodeRuns(Transaction& t, int64_t run_id, std::vector<model::NodeRunRecord>& out) {
  out.clear();
  try {
    auto res = TX(t).Work().exec_prepared("list_node_runs", run_id);
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadNodeRun(row));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteRunTags(Transaction& t, int64_t run_id) {
  try {
    TX(t).Work().exec_params("DELETE FROM workflow_run_tag WHERE workflow_run_id=$1;", run_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertRunTags(Transaction& t, const std::vector<model::RunTagRecord>& tags) {
  try {
    auto& work = TX(t).Work();
    for (const auto& tag : tags) {
      work.exec_params("INSERT INTO workflow_run_tag(workflow_run_id,tag,value) VALUES($1,$2,$3);", tag.workflow_run_id, tag.tag, tag.value);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ListRunTags(Transaction& t, int64_t run_id, std::vector<model::RunTagRecord>& out) {
  out.clear();
  try {
    auto res = TX(t).Work().exec_prepared("list_run_tags", run_id);
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back({row[0].as<int64_t>(), row[1].c_str(), row[2].c_str()});
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ListWorkflowTagValues(Transaction& t, const std::string& project_key, const std::string& workflow_name,
                                           std::vector<model::RunTagRecord>& out) {
  out.clear();
  try {
    auto res = TX(t).Work().exec_params(
        "SELECT DISTINCT t.tag, t.value FROM workflow_run_tag t JOIN workflow_run r ON r.id = t.workflow_run_id "
        "WHERE r.project_key=$1 AND r.workflow_name=$2 ORDER BY t.tag, t.value;",
        project_key, workflow_name);
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back({0, row[0].c_str(), row[1].c_str()});
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace wfrun::db::postgres
