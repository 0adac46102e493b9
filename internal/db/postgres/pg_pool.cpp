#include "pg_pool.hpp"

#include <stdexcept>

namespace wfrun::db::postgres {

namespace {

struct PreparedStatement {
  const char* name;
  const char* sql;
};

// lookups every AdvanceNode / StopRun goes through
constexpr PreparedStatement kPrepared[] = {
    {"find_run_by_id",
     "SELECT id,workflow_id,project_id,project_key,workflow_name,num,status,stop_requested,start_ms,last_modified_ms,"
     "workflow::text,infos::text FROM workflow_run WHERE id=$1"},
    {"lock_run", "SELECT id FROM workflow_run WHERE id=$1 FOR UPDATE NOWAIT"},
    {"next_run_number", "SELECT workflow_sequences_nextval($1)"},
    {"list_node_runs",
     "SELECT id,workflow_run_id,workflow_node_id,sub_num,status,start_ms,done_ms,last_modified_ms "
     "FROM workflow_node_run WHERE workflow_run_id=$1 ORDER BY sub_num DESC, id ASC"},
    {"list_run_tags", "SELECT workflow_run_id,tag,value FROM workflow_run_tag WHERE workflow_run_id=$1 ORDER BY tag, value"},
};

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::unique_ptr<pqxx::connection> PgPool::Connect() const {
  return std::make_unique<pqxx::connection>(conninfo_);
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_ptr<pqxx::connection> conn;
  {
    std::unique_lock lock(mutex_);
    returned_.wait(lock, [this] { return !idle_.empty() || open_ < max_connections_; });

    while (!idle_.empty() && !conn) {
      conn = std::move(idle_.front());
      idle_.pop_front();
      if (!conn->is_open()) {
        // dropped by the server while idle
        conn.reset();
        --open_;
      }
    }
    if (conn) {
      return Lend(std::move(conn));
    }
    ++open_;
  }

  try {
    conn = Connect();
    for (const auto& statement : kPrepared) {
      conn->prepare(statement.name, statement.sql);
    }
  } catch (const std::exception&) {
    {
      std::lock_guard lock(mutex_);
      --open_;
    }
    returned_.notify_one();
    throw;
  }
  return Lend(std::move(conn));
}

std::shared_ptr<pqxx::connection> PgPool::Lend(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> pool = weak_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [pool](pqxx::connection* lent) {
    std::unique_ptr<pqxx::connection> owned(lent);
    if (auto self = pool.lock()) {
      self->Return(std::move(owned));
    }
  });
}

void PgPool::Return(std::unique_ptr<pqxx::connection> conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.push_back(std::move(conn));
  }
  returned_.notify_one();
}

} // namespace wfrun::db::postgres
