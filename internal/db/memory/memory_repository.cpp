#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "memory_tx.hpp"

namespace flowsched::db::memory {

namespace {

template <typename Record>
void SortByCreation(std::vector<Record>& records) {
  std::sort(records.begin(), records.end(), [](const Record& a, const Record& b) {
    return std::tie(a.created_at_ms, a.id) < std::tie(b.created_at_ms, b.id);
  });
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Deployments
// ------------------------------------------------------------------

Result MemoryRepository::InsertDeployment(Transaction& t, const model::DeploymentRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.deployments.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "deployment " + r.id);
  if (s.deployment_names.contains(r.name)) return Result::Err(ErrorCode::AlreadyExists, "deployment name " + r.name);
  s.deployments[r.id] = r;
  s.deployment_names.insert(r.name);
  return Result::Ok();
}

std::optional<model::DeploymentRecord> MemoryRepository::GetDeployment(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.deployments.find(id);
  if (it == s.deployments.end()) return std::nullopt;
  return it->second;
}

std::vector<model::DeploymentRecord> MemoryRepository::ListDeployments(Transaction& t, uint64_t offset,
                                                                       std::optional<uint64_t> limit) {
  const auto&                          s = TX(t).View();
  std::vector<model::DeploymentRecord> out;
  uint64_t                             skipped = 0;
  for (const auto& [_, record] : s.deployments) {
    if (skipped < offset) {
      ++skipped;
      continue;
    }
    if (limit.has_value() && out.size() >= *limit) break;
    out.push_back(record);
  }
  return out;
}

Result MemoryRepository::DeleteDeployment(Transaction& t, const std::string& id) {
  auto& s  = TX(t).Mutable();
  auto  it = s.deployments.find(id);
  if (it == s.deployments.end()) return Result::Err(ErrorCode::NotFound, "deployment " + id);

  s.deployment_names.erase(it->second.name);
  s.deployments.erase(it);

  for (auto sit = s.schedules.begin(); sit != s.schedules.end();) {
    if (sit->second.deployment_id == id) {
      sit = s.schedules.erase(sit);
    } else {
      ++sit;
    }
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Schedules
// ------------------------------------------------------------------

Result MemoryRepository::InsertSchedule(Transaction& t, const model::ScheduleRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.deployments.contains(r.deployment_id)) return Result::Err(ErrorCode::NotFound, "deployment " + r.deployment_id);
  if (s.schedules.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "schedule " + r.id);
  if (r.interval_seconds == 0) return Result::Err(ErrorCode::ConstraintViolation, "interval_seconds must be positive");
  s.schedules[r.id] = r;
  return Result::Ok();
}

std::vector<model::ScheduleRecord> MemoryRepository::ListSchedules(Transaction& t, const std::string& deployment_id) {
  std::vector<model::ScheduleRecord> out;
  for (const auto& [_, record] : TX(t).View().schedules)
    if (record.deployment_id == deployment_id) out.push_back(record);
  SortByCreation(out);
  return out;
}

Result MemoryRepository::DeleteSchedule(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.schedules.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "schedule " + id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Flow runs
// ------------------------------------------------------------------

Result MemoryRepository::InsertFlowRunsIgnoreConflicts(Transaction& t, const std::vector<model::FlowRunRecord>& runs) {
  auto& s = TX(t).Mutable();
  for (const auto& r : runs) {
    if (s.run_keys.contains({r.flow_id, r.idempotency_key})) continue;
    if (s.flow_runs.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "flow run " + r.id);
    s.flow_runs[r.id] = r;
    s.run_keys.emplace(r.flow_id, r.idempotency_key);
  }
  return Result::Ok();
}

Result MemoryRepository::ListStatelessFlowRunIds(Transaction& t, const std::vector<std::string>& ids,
                                                 std::vector<std::string>& out) {
  const auto& s = TX(t).View();
  for (const auto& id : ids) {
    if (!s.flow_runs.contains(id)) continue;
    auto it = s.states_by_run.find(id);
    if (it == s.states_by_run.end() || it->second.empty()) out.push_back(id);
  }
  return Result::Ok();
}

Result MemoryRepository::InsertFlowRunStates(Transaction& t, const std::vector<model::FlowRunStateRecord>& states) {
  auto& s = TX(t).Mutable();
  for (const auto& r : states) {
    if (!s.flow_runs.contains(r.flow_run_id))
      return Result::Err(ErrorCode::ConstraintViolation, "flow run " + r.flow_run_id + " does not exist");
    if (s.states.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "flow run state " + r.id);
    s.states[r.id] = r;
    s.states_by_run[r.flow_run_id].push_back(r.id);
  }
  return Result::Ok();
}

Result MemoryRepository::LinkFlowRunStates(Transaction& t, StateLinkStrategy strategy,
                                           const std::vector<std::string>& state_ids) {
  auto& s = TX(t).Mutable();

  if (strategy == StateLinkStrategy::kUpdateJoin) {
    // walk the joined states, update the run each one points at
    for (const auto& state_id : state_ids) {
      auto sit = s.states.find(state_id);
      if (sit == s.states.end()) continue;
      auto rit = s.flow_runs.find(sit->second.flow_run_id);
      if (rit == s.flow_runs.end()) continue;
      rit->second.state_id = state_id;
    }
    return Result::Ok();
  }

  // correlated subquery: restrict to the owning runs, then look up each
  // run's state among state_ids
  const std::set<std::string> wanted(state_ids.begin(), state_ids.end());
  std::set<std::string>       owners;
  for (const auto& state_id : wanted) {
    auto sit = s.states.find(state_id);
    if (sit != s.states.end()) owners.insert(sit->second.flow_run_id);
  }

  for (const auto& run_id : owners) {
    auto rit = s.flow_runs.find(run_id);
    if (rit == s.flow_runs.end()) continue;

    std::optional<std::string> linked;
    auto                       bit = s.states_by_run.find(run_id);
    if (bit != s.states_by_run.end()) {
      for (const auto& candidate : bit->second) {
        if (wanted.contains(candidate)) {
          linked = candidate;
          break;
        }
      }
    }
    rit->second.state_id = linked;
  }
  return Result::Ok();
}

std::optional<model::FlowRunRecord> MemoryRepository::GetFlowRun(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.flow_runs.find(id);
  if (it == s.flow_runs.end()) return std::nullopt;
  return it->second;
}

std::vector<model::FlowRunRecord> MemoryRepository::ListFlowRuns(Transaction& t, const std::string& deployment_id) {
  std::vector<model::FlowRunRecord> out;
  for (const auto& [_, record] : TX(t).View().flow_runs)
    if (record.deployment_id == deployment_id) out.push_back(record);
  SortByCreation(out);
  return out;
}

std::vector<model::FlowRunStateRecord> MemoryRepository::ListFlowRunStates(Transaction& t, const std::string& flow_run_id) {
  const auto&                            s = TX(t).View();
  std::vector<model::FlowRunStateRecord> out;
  auto                                   it = s.states_by_run.find(flow_run_id);
  if (it == s.states_by_run.end()) return out;
  for (const auto& id : it->second) out.push_back(s.states.at(id));
  SortByCreation(out);
  return out;
}

} // namespace flowsched::db::memory
