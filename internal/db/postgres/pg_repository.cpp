#include "pg_repository.hpp"

#include <algorithm>

#include "internal/db/sql/sql_params.hpp"

namespace flowsched::db::postgres {

namespace {

model::DeploymentRecord ReadDeployment(const pqxx::row& row) {
  model::DeploymentRecord r;
  r.id            = row[0].c_str();
  r.name          = row[1].c_str();
  r.flow_id       = row[2].c_str();
  r.created_at_ms = row[3].as<uint64_t>();
  return r;
}

model::FlowRunRecord ReadFlowRun(const pqxx::row& row) {
  model::FlowRunRecord r;
  r.id              = row[0].c_str();
  r.flow_id         = row[1].c_str();
  r.deployment_id   = row[2].is_null() ? "" : row[2].c_str();
  r.parameters      = row[3].c_str();
  r.idempotency_key = row[4].is_null() ? "" : row[4].c_str();
  r.tags            = row[5].c_str();
  r.schedule_id     = row[6].is_null() ? "" : row[6].c_str();
  r.auto_scheduled  = row[7].as<bool>();
  if (!row[8].is_null()) r.state_id = row[8].c_str();
  r.created_at_ms = row[9].as<uint64_t>();
  return r;
}

// ($1,$2,...),(...) for `rows` rows, one placeholder per entry of `casts`.
std::string ValuesList(std::size_t rows, const std::vector<const char*>& casts) {
  std::string out;
  std::size_t next = 1;
  for (std::size_t i = 0; i < rows; ++i) {
    if (i != 0) out += ',';
    out += '(';
    for (std::size_t c = 0; c < casts.size(); ++c) {
      if (c != 0) out += ',';
      out += '$';
      out += std::to_string(next++);
      out += casts[c];
    }
    out += ')';
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) return Result::Err(ErrorCode::SerializationFailure, e.what());
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) return Result::Err(ErrorCode::Conflict, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Deployments
// ------------------------------------------------------------------

Result PgRepository::InsertDeployment(Transaction& t, const model::DeploymentRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_deployment", r.id, r.name, r.flow_id, static_cast<int64_t>(r.created_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DeploymentRecord> PgRepository::GetDeployment(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_deployment", id);
  if (res.empty()) return std::nullopt;
  return ReadDeployment(res[0]);
}

std::vector<model::DeploymentRecord> PgRepository::ListDeployments(Transaction& t, uint64_t offset,
                                                                   std::optional<uint64_t> limit) {
  // NULL limit means no limit in postgres
  std::optional<int64_t> pg_limit;
  if (limit.has_value()) pg_limit = static_cast<int64_t>(*limit);

  auto res = TX(t).Work().exec_params(
      "SELECT id,name,flow_id,created_at_ms FROM deployment ORDER BY id ASC LIMIT $1 OFFSET $2;",
      pg_limit, static_cast<int64_t>(offset));

  std::vector<model::DeploymentRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadDeployment(row));
  return out;
}

Result PgRepository::DeleteDeployment(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_deployment", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "deployment " + id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Schedules
// ------------------------------------------------------------------

Result PgRepository::InsertSchedule(Transaction& t, const model::ScheduleRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_schedule", r.id, r.deployment_id, static_cast<int64_t>(r.interval_seconds), r.anchor_ms,
                               r.parameters, static_cast<int64_t>(r.created_at_ms));
    return Result::Ok();
  } catch (const pqxx::foreign_key_violation&) {
    return Result::Err(ErrorCode::NotFound, "deployment " + r.deployment_id);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ScheduleRecord> PgRepository::ListSchedules(Transaction& t, const std::string& deployment_id) {
  auto res = TX(t).Work().exec_prepared("list_schedules", deployment_id);

  std::vector<model::ScheduleRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::ScheduleRecord r;
    r.id               = row[0].c_str();
    r.deployment_id    = row[1].c_str();
    r.interval_seconds = row[2].as<uint64_t>();
    r.anchor_ms        = row[3].as<int64_t>();
    r.parameters       = row[4].c_str();
    r.created_at_ms    = row[5].as<uint64_t>();
    out.push_back(std::move(r));
  }
  return out;
}

Result PgRepository::DeleteSchedule(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_schedule", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "schedule " + id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Flow runs
// ------------------------------------------------------------------

Result PgRepository::InsertFlowRunsIgnoreConflicts(Transaction& t, const std::vector<model::FlowRunRecord>& runs) {
  static const std::vector<const char*> kCasts = {"", "", "", "::jsonb", "", "::jsonb", "", "", "", ""};

  try {
    auto& tx = TX(t).Work();
    for (std::size_t begin = 0; begin < runs.size(); begin += sql::kMaxBatchRows) {
      const std::size_t end = std::min(runs.size(), begin + sql::kMaxBatchRows);

      // no conflict target: run ids derive from (flow_id, idempotency_key),
      // so a concurrent duplicate also collides on the primary key
      const std::string query =
          "INSERT INTO flow_run(id,flow_id,deployment_id,parameters,idempotency_key,tags,schedule_id,auto_scheduled,state_id,created_at_ms) "
          "VALUES " + ValuesList(end - begin, kCasts) +
          " ON CONFLICT DO NOTHING;";

      pqxx::params params;
      for (std::size_t i = begin; i < end; ++i) {
        const auto& r = runs[i];
        params.append(r.id);
        params.append(r.flow_id);
        params.append(r.deployment_id);
        params.append(r.parameters);
        params.append(r.idempotency_key);
        params.append(r.tags);
        params.append(r.schedule_id);
        params.append(r.auto_scheduled);
        params.append(r.state_id);
        params.append(static_cast<int64_t>(r.created_at_ms));
      }
      tx.exec_params(query, params);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ListStatelessFlowRunIds(Transaction& t, const std::vector<std::string>& ids, std::vector<std::string>& out) {
  try {
    auto& tx = TX(t).Work();
    for (std::size_t begin = 0; begin < ids.size(); begin += sql::kMaxBatchRows) {
      const std::size_t end = std::min(ids.size(), begin + sql::kMaxBatchRows);

      const std::string query =
          "SELECT flow_run.id FROM flow_run"
          " LEFT OUTER JOIN flow_run_state ON flow_run.id = flow_run_state.flow_run_id"
          " WHERE flow_run_state.id IS NULL AND flow_run.id IN (" +
          sql::Placeholders(end - begin, sql::PlaceholderStyle::kDollar) + ");";

      pqxx::params params;
      for (std::size_t i = begin; i < end; ++i) params.append(ids[i]);

      auto res = tx.exec_params(query, params);
      for (const auto& row : res) out.emplace_back(row[0].c_str());
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::InsertFlowRunStates(Transaction& t, const std::vector<model::FlowRunStateRecord>& states) {
  static const std::vector<const char*> kCasts = {"", "", "", "", "::jsonb", ""};

  try {
    auto& tx = TX(t).Work();
    for (std::size_t begin = 0; begin < states.size(); begin += sql::kMaxBatchRows) {
      const std::size_t end = std::min(states.size(), begin + sql::kMaxBatchRows);

      const std::string query =
          "INSERT INTO flow_run_state(id,flow_run_id,type,message,state_details,created_at_ms) VALUES " +
          ValuesList(end - begin, kCasts) + ";";

      pqxx::params params;
      for (std::size_t i = begin; i < end; ++i) {
        const auto& s = states[i];
        params.append(s.id);
        params.append(s.flow_run_id);
        params.append(static_cast<int>(s.type));
        params.append(s.message);
        params.append(s.state_details);
        params.append(static_cast<int64_t>(s.created_at_ms));
      }
      tx.exec_params(query, params);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::LinkFlowRunStates(Transaction& t, StateLinkStrategy strategy, const std::vector<std::string>& state_ids) {
  try {
    auto& tx = TX(t).Work();
    for (std::size_t begin = 0; begin < state_ids.size(); begin += sql::kMaxBatchRows) {
      const std::size_t end  = std::min(state_ids.size(), begin + sql::kMaxBatchRows);
      const std::size_t n    = end - begin;
      const auto        list = sql::Placeholders(n, sql::PlaceholderStyle::kDollar);

      std::string query;
      if (strategy == StateLinkStrategy::kUpdateJoin) {
        query =
            "UPDATE flow_run SET state_id = flow_run_state.id FROM flow_run_state"
            " WHERE flow_run_state.flow_run_id = flow_run.id AND flow_run_state.id IN (" + list + ");";
      } else {
        // both IN lists refer to the same $1..$n
        query =
            "UPDATE flow_run SET state_id = (SELECT flow_run_state.id FROM flow_run_state"
            " WHERE flow_run_state.flow_run_id = flow_run.id AND flow_run_state.id IN (" + list + ") LIMIT 1)"
            " WHERE flow_run.id IN (SELECT flow_run_id FROM flow_run_state WHERE id IN (" + list + "));";
      }

      pqxx::params params;
      for (std::size_t i = begin; i < end; ++i) params.append(state_ids[i]);
      tx.exec_params(query, params);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::FlowRunRecord> PgRepository::GetFlowRun(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_flow_run", id);
  if (res.empty()) return std::nullopt;
  return ReadFlowRun(res[0]);
}

std::vector<model::FlowRunRecord> PgRepository::ListFlowRuns(Transaction& t, const std::string& deployment_id) {
  auto res = TX(t).Work().exec_prepared("list_flow_runs", deployment_id);

  std::vector<model::FlowRunRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadFlowRun(row));
  return out;
}

std::vector<model::FlowRunStateRecord> PgRepository::ListFlowRunStates(Transaction& t, const std::string& flow_run_id) {
  auto res = TX(t).Work().exec_prepared("list_flow_run_states", flow_run_id);

  std::vector<model::FlowRunStateRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::FlowRunStateRecord s;
    s.id            = row[0].c_str();
    s.flow_run_id   = row[1].c_str();
    s.type          = static_cast<flowsched::core::v1::StateType>(row[2].as<int>());
    s.message       = row[3].is_null() ? "" : row[3].c_str();
    s.state_details = row[4].c_str();
    s.created_at_ms = row[5].as<uint64_t>();
    out.push_back(std::move(s));
  }
  return out;
}

} // namespace flowsched::db::postgres
