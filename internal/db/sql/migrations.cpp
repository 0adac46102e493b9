#include "migrations.hpp"

namespace wfrun::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS workflow_run (id INTEGER PRIMARY KEY AUTOINCREMENT, workflow_id INTEGER NOT NULL, project_id INTEGER NOT NULL, "
      "project_key TEXT NOT NULL, workflow_name TEXT NOT NULL, num INTEGER NOT NULL, status INTEGER NOT NULL, stop_requested INTEGER NOT NULL DEFAULT 0, "
      "start_ms INTEGER NOT NULL, last_modified_ms INTEGER NOT NULL, workflow TEXT, infos TEXT, UNIQUE(workflow_id, num));",
      "CREATE INDEX IF NOT EXISTS idx_workflow_run_project_workflow ON workflow_run(project_key, workflow_name, start_ms);",
      "CREATE TABLE IF NOT EXISTS workflow_node_run (id INTEGER PRIMARY KEY AUTOINCREMENT, "
      "workflow_run_id INTEGER NOT NULL REFERENCES workflow_run(id) ON DELETE CASCADE, workflow_node_id INTEGER NOT NULL, sub_num INTEGER NOT NULL, "
      "status INTEGER NOT NULL, start_ms INTEGER NOT NULL, done_ms INTEGER NOT NULL DEFAULT 0, last_modified_ms INTEGER NOT NULL, "
      "UNIQUE(workflow_run_id, workflow_node_id, sub_num));",
      "CREATE TABLE IF NOT EXISTS workflow_run_tag (workflow_run_id INTEGER NOT NULL REFERENCES workflow_run(id) ON DELETE CASCADE, tag TEXT NOT NULL, "
      "value TEXT NOT NULL, PRIMARY KEY (workflow_run_id, tag, value));",
      "CREATE TABLE IF NOT EXISTS workflow_sequence (workflow_id INTEGER PRIMARY KEY, current_value INTEGER NOT NULL);",
      // run claims shared by every connection and process on the file
      "CREATE TABLE IF NOT EXISTS workflow_run_lock (run_id INTEGER PRIMARY KEY, owner TEXT NOT NULL, acquired_ms INTEGER NOT NULL);"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS workflow_run (id BIGSERIAL PRIMARY KEY, workflow_id BIGINT NOT NULL, project_id BIGINT NOT NULL, "
      "project_key TEXT NOT NULL, workflow_name TEXT NOT NULL, num BIGINT NOT NULL, status INTEGER NOT NULL, stop_requested BOOLEAN NOT NULL DEFAULT FALSE, "
      "start_ms BIGINT NOT NULL, last_modified_ms BIGINT NOT NULL, workflow JSONB, infos JSONB, UNIQUE(workflow_id, num));",
      "CREATE INDEX IF NOT EXISTS idx_workflow_run_project_workflow ON workflow_run(project_key, workflow_name, start_ms);",
      "CREATE TABLE IF NOT EXISTS workflow_node_run (id BIGSERIAL PRIMARY KEY, "
      "workflow_run_id BIGINT NOT NULL REFERENCES workflow_run(id) ON DELETE CASCADE, workflow_node_id BIGINT NOT NULL, sub_num INTEGER NOT NULL, "
      "status INTEGER NOT NULL, start_ms BIGINT NOT NULL, done_ms BIGINT NOT NULL DEFAULT 0, last_modified_ms BIGINT NOT NULL, "
      "UNIQUE(workflow_run_id, workflow_node_id, sub_num));",
      "CREATE TABLE IF NOT EXISTS workflow_run_tag (workflow_run_id BIGINT NOT NULL REFERENCES workflow_run(id) ON DELETE CASCADE, tag TEXT NOT NULL, "
      "value TEXT NOT NULL, PRIMARY KEY (workflow_run_id, tag, value));",
      "CREATE TABLE IF NOT EXISTS workflow_sequence (workflow_id BIGINT PRIMARY KEY, current_value BIGINT NOT NULL);",
      "CREATE OR REPLACE FUNCTION workflow_sequences_nextval(wid BIGINT) RETURNS BIGINT AS $$ "
      "INSERT INTO workflow_sequence(workflow_id, current_value) VALUES (wid, 1) "
      "ON CONFLICT (workflow_id) DO UPDATE SET current_value = workflow_sequence.current_value + 1 "
      "RETURNING current_value; $$ LANGUAGE SQL;"};
  return kSchema;
}

} // namespace wfrun::db::sql
