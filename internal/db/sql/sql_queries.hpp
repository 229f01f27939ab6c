#pragma once

namespace flowsched::db::sql {

/*
  Canonical SQL used by the SQLite backend.

  Statements that take an id list are assembled at call time from a
  prefix and Placeholders().
*/

// deployments

static constexpr const char* INSERT_DEPLOYMENT =
    "INSERT INTO deployment(id,name,flow_id,created_at_ms)"
    " VALUES(?,?,?,?);";

static constexpr const char* SELECT_DEPLOYMENT =
    "SELECT id,name,flow_id,created_at_ms"
    " FROM deployment WHERE id=?;";

static constexpr const char* SELECT_DEPLOYMENTS =
    "SELECT id,name,flow_id,created_at_ms"
    " FROM deployment ORDER BY id ASC LIMIT ? OFFSET ?;";

static constexpr const char* DELETE_DEPLOYMENT =
    "DELETE FROM deployment WHERE id=?;";

// schedules

static constexpr const char* INSERT_SCHEDULE =
    "INSERT INTO deployment_schedule(id,deployment_id,interval_seconds,anchor_ms,parameters,created_at_ms)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* SELECT_SCHEDULES =
    "SELECT id,deployment_id,interval_seconds,anchor_ms,parameters,created_at_ms"
    " FROM deployment_schedule WHERE deployment_id=?"
    " ORDER BY created_at_ms ASC, id ASC;";

static constexpr const char* DELETE_SCHEDULE =
    "DELETE FROM deployment_schedule WHERE id=?;";

// flow runs

static constexpr const char* INSERT_FLOW_RUN_IGNORE =
    "INSERT INTO flow_run(id,flow_id,deployment_id,parameters,idempotency_key,tags,schedule_id,auto_scheduled,state_id,created_at_ms)"
    " VALUES(?,?,?,?,?,?,?,?,?,?)"
    " ON CONFLICT(flow_id,idempotency_key) DO NOTHING;";

static constexpr const char* SELECT_STATELESS_FLOW_RUNS_PREFIX =
    "SELECT flow_run.id FROM flow_run"
    " LEFT OUTER JOIN flow_run_state ON flow_run.id = flow_run_state.flow_run_id"
    " WHERE flow_run_state.id IS NULL AND flow_run.id IN (";

static constexpr const char* INSERT_FLOW_RUN_STATE =
    "INSERT INTO flow_run_state(id,flow_run_id,type,message,state_details,created_at_ms)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* SELECT_FLOW_RUN =
    "SELECT id,flow_id,deployment_id,parameters,idempotency_key,tags,schedule_id,auto_scheduled,state_id,created_at_ms"
    " FROM flow_run WHERE id=?;";

static constexpr const char* SELECT_FLOW_RUNS_BY_DEPLOYMENT =
    "SELECT id,flow_id,deployment_id,parameters,idempotency_key,tags,schedule_id,auto_scheduled,state_id,created_at_ms"
    " FROM flow_run WHERE deployment_id=?"
    " ORDER BY created_at_ms ASC, id ASC;";

static constexpr const char* SELECT_FLOW_RUN_STATES =
    "SELECT id,flow_run_id,type,message,state_details,created_at_ms"
    " FROM flow_run_state WHERE flow_run_id=?"
    " ORDER BY created_at_ms ASC, id ASC;";

}
