#include "migrations.hpp"

namespace flowsched::db::sql {

void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS deployment (id TEXT PRIMARY KEY, name TEXT NOT NULL UNIQUE, flow_id TEXT NOT NULL, created_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS deployment_schedule (id TEXT PRIMARY KEY, deployment_id TEXT NOT NULL REFERENCES deployment(id) ON DELETE CASCADE, "
      "interval_seconds INTEGER NOT NULL CHECK (interval_seconds > 0), anchor_ms INTEGER NOT NULL, parameters TEXT NOT NULL DEFAULT '{}', "
      "created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS ix_deployment_schedule__deployment_id ON deployment_schedule(deployment_id);",
      "CREATE TABLE IF NOT EXISTS flow_run (id TEXT PRIMARY KEY, flow_id TEXT NOT NULL, deployment_id TEXT, parameters TEXT NOT NULL DEFAULT '{}', "
      "idempotency_key TEXT, tags TEXT NOT NULL DEFAULT '[]', schedule_id TEXT, auto_scheduled INTEGER NOT NULL DEFAULT 0, state_id TEXT, "
      "created_at_ms INTEGER NOT NULL, CONSTRAINT uq_flow_run__flow_id_idempotency_key UNIQUE (flow_id, idempotency_key));",
      "CREATE INDEX IF NOT EXISTS ix_flow_run__deployment_id ON flow_run(deployment_id);",
      "CREATE TABLE IF NOT EXISTS flow_run_state (id TEXT PRIMARY KEY, flow_run_id TEXT NOT NULL REFERENCES flow_run(id) ON DELETE CASCADE, "
      "type INTEGER NOT NULL, message TEXT, state_details TEXT NOT NULL DEFAULT '{}', created_at_ms INTEGER NOT NULL);",
      "CREATE INDEX IF NOT EXISTS ix_flow_run_state__flow_run_id ON flow_run_state(flow_run_id);"};
  return kSchema;
}

const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS deployment (id TEXT PRIMARY KEY, name TEXT NOT NULL UNIQUE, flow_id TEXT NOT NULL, created_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS deployment_schedule (id TEXT PRIMARY KEY, deployment_id TEXT NOT NULL REFERENCES deployment(id) ON DELETE CASCADE, "
      "interval_seconds BIGINT NOT NULL CHECK (interval_seconds > 0), anchor_ms BIGINT NOT NULL, parameters JSONB NOT NULL DEFAULT '{}', "
      "created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS ix_deployment_schedule__deployment_id ON deployment_schedule(deployment_id);",
      "CREATE TABLE IF NOT EXISTS flow_run (id TEXT PRIMARY KEY, flow_id TEXT NOT NULL, deployment_id TEXT, parameters JSONB NOT NULL DEFAULT '{}', "
      "idempotency_key TEXT, tags JSONB NOT NULL DEFAULT '[]', schedule_id TEXT, auto_scheduled BOOLEAN NOT NULL DEFAULT FALSE, state_id TEXT, "
      "created_at_ms BIGINT NOT NULL, CONSTRAINT uq_flow_run__flow_id_idempotency_key UNIQUE (flow_id, idempotency_key));",
      "CREATE INDEX IF NOT EXISTS ix_flow_run__deployment_id ON flow_run(deployment_id);",
      "CREATE TABLE IF NOT EXISTS flow_run_state (id TEXT PRIMARY KEY, flow_run_id TEXT NOT NULL REFERENCES flow_run(id) ON DELETE CASCADE, "
      "type SMALLINT NOT NULL, message TEXT, state_details JSONB NOT NULL DEFAULT '{}', created_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS ix_flow_run_state__flow_run_id ON flow_run_state(flow_run_id);"};
  return kSchema;
}

} // namespace flowsched::db::sql
