#include "internal/scheduler/occurrence_generator.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <set>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using flowsched::db::memory::MemoryRepository;
using flowsched::scheduler::OccurrenceGenerator;
using flowsched::util::TimePoint;
using namespace std::chrono_literals;

TimePoint T0() {
  return *flowsched::util::ParseRfc3339("2024-01-01T00:00:00Z");
}

std::string AddDeployment(MemoryRepository& repo, const std::string& id, const std::string& flow_id) {
  flowsched::db::model::DeploymentRecord deployment;
  deployment.id      = id;
  deployment.name    = "deployment-" + id;
  deployment.flow_id = flow_id;

  auto tx = repo.Begin();
  assert(repo.InsertDeployment(*tx, deployment));
  tx->Commit();
  return id;
}

std::string AddSchedule(MemoryRepository& repo, const std::string& id, const std::string& deployment_id, uint64_t interval_seconds,
                        TimePoint anchor, const std::string& parameters = "{}") {
  flowsched::db::model::ScheduleRecord schedule;
  schedule.id               = id;
  schedule.deployment_id    = deployment_id;
  schedule.interval_seconds = interval_seconds;
  schedule.anchor_ms        = static_cast<int64_t>(flowsched::util::ToUnixMillis(anchor));
  schedule.parameters       = parameters;

  auto tx = repo.Begin();
  assert(repo.InsertSchedule(*tx, schedule));
  tx->Commit();
  return id;
}

void TestMissingDeploymentThrowsNotFound() {
  auto                repo = std::make_shared<MemoryRepository>();
  OccurrenceGenerator generator(repo);

  auto tx    = repo->Begin();
  bool threw = false;
  try {
    (void)generator.Generate(*tx, "missing", T0(), T0() + 1h, 10);
  } catch (const flowsched::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestCandidateShape() {
  auto repo = std::make_shared<MemoryRepository>();
  AddDeployment(*repo, "d1", "flow-1");
  AddSchedule(*repo, "s1", "d1", 3600, T0(), R"({"x":1})");

  OccurrenceGenerator generator(repo);
  auto                tx         = repo->Begin();
  auto                candidates = generator.Generate(*tx, "d1", T0(), T0() + 2h, 10);
  assert(candidates.size() == 3);

  const auto& first = candidates[0];
  assert(first.scheduled_time == T0());
  assert(first.run.flow_id == "flow-1");
  assert(first.run.deployment_id == "d1");
  assert(first.run.parameters == R"({"x":1})");
  assert(first.run.idempotency_key == "scheduled s1 2024-01-01T00:00:00+00:00");
  assert(first.run.tags == R"(["auto-scheduled"])");
  assert(first.run.schedule_id == "s1");
  assert(first.run.auto_scheduled);
  assert(!first.run.state_id.has_value());

  assert(first.initial_state.flow_run_id == first.run.id);
  assert(first.initial_state.type == flowsched::core::v1::STATE_TYPE_SCHEDULED);
  assert(first.initial_state.message == "Flow run scheduled");
  assert(first.initial_state.state_details.find("\"scheduledTime\":\"2024-01-01T00:00:00Z\"") != std::string::npos);
  assert(first.initial_state.state_details.find("\"scheduleId\":\"s1\"") != std::string::npos);
  assert(first.initial_state.state_details.find("\"autoScheduled\":true") != std::string::npos);

  assert(candidates[1].run.idempotency_key == "scheduled s1 2024-01-01T01:00:00+00:00");
}

void TestIdentityIsStableAcrossGenerations() {
  auto repo = std::make_shared<MemoryRepository>();
  AddDeployment(*repo, "d1", "flow-1");
  AddSchedule(*repo, "s1", "d1", 60, T0());

  OccurrenceGenerator generator(repo);
  auto                tx     = repo->Begin();
  auto                first  = generator.Generate(*tx, "d1", T0(), T0() + 10min, 100);
  auto                second = generator.Generate(*tx, "d1", T0(), T0() + 10min, 100);
  assert(first.size() == 11);
  assert(first.size() == second.size());

  std::set<std::string> run_ids;
  std::set<std::string> state_ids;
  for (std::size_t i = 0; i < first.size(); ++i) {
    assert(first[i].run.id == second[i].run.id);
    assert(first[i].initial_state.id == second[i].initial_state.id);
    run_ids.insert(first[i].run.id);
    state_ids.insert(first[i].initial_state.id);
  }
  assert(run_ids.size() == first.size());
  assert(state_ids.size() == first.size());
}

void TestMaxRunsAppliesPerSchedule() {
  auto repo = std::make_shared<MemoryRepository>();
  AddDeployment(*repo, "d1", "flow-1");
  AddSchedule(*repo, "s1", "d1", 60, T0());
  AddSchedule(*repo, "s2", "d1", 60, T0());

  OccurrenceGenerator generator(repo);
  auto                tx = repo->Begin();

  auto candidates = generator.Generate(*tx, "d1", T0(), T0() + 24h, 4);
  assert(candidates.size() == 8);

  // same instants, different schedules: distinct keys
  std::set<std::string> keys;
  for (const auto& c : candidates) keys.insert(c.run.idempotency_key);
  assert(keys.size() == 8);

  assert(generator.Generate(*tx, "d1", T0(), T0() + 24h, 0).empty());
}

void TestWindowBounds() {
  auto repo = std::make_shared<MemoryRepository>();
  AddDeployment(*repo, "d1", "flow-1");
  AddSchedule(*repo, "s1", "d1", 3600, T0());

  OccurrenceGenerator generator(repo);
  auto                tx = repo->Begin();

  const auto start      = T0() + 30min;
  const auto end        = T0() + 3h + 30min;
  auto       candidates = generator.Generate(*tx, "d1", start, end, 100);
  assert(candidates.size() == 3);
  for (const auto& c : candidates) {
    assert(c.scheduled_time >= start && c.scheduled_time <= end);
  }

  assert(generator.Generate(*tx, "d1", end, start, 100).empty());
}

void TestDefaults() {
  auto repo = std::make_shared<MemoryRepository>();
  AddDeployment(*repo, "d1", "flow-1");
  AddSchedule(*repo, "s1", "d1", 3600, T0());
  AddDeployment(*repo, "d2", "flow-2");
  AddSchedule(*repo, "s2", "d2", 30 * 24 * 3600, flowsched::util::Now());

  OccurrenceGenerator generator(repo);
  auto                tx     = repo->Begin();
  const auto          before = flowsched::util::Now();

  // hourly for a year, capped at 100, all in the future
  auto hourly = generator.Generate(*tx, "d1");
  assert(hourly.size() == flowsched::scheduler::kDefaultMaxRuns);
  for (const auto& c : hourly) assert(c.scheduled_time >= before);

  // every 30 days for one calendar year: 12 or 13 occurrences
  auto monthly = generator.Generate(*tx, "d2");
  assert(monthly.size() >= 12 && monthly.size() <= 13);
  assert(monthly.back().scheduled_time <= flowsched::util::AddYears(flowsched::util::Now(), 1));
}

void TestDeploymentWithoutSchedules() {
  auto repo = std::make_shared<MemoryRepository>();
  AddDeployment(*repo, "d1", "flow-1");

  OccurrenceGenerator generator(repo);
  auto                tx = repo->Begin();
  assert(generator.Generate(*tx, "d1", T0(), T0() + 24h, 10).empty());
}

} // namespace

int main() {
  TestMissingDeploymentThrowsNotFound();
  TestCandidateShape();
  TestIdentityIsStableAcrossGenerations();
  TestMaxRunsAppliesPerSchedule();
  TestWindowBounds();
  TestDefaults();
  TestDeploymentWithoutSchedules();

  std::cout << "flowsched_unit_occurrence_generator: pass\n";
  return 0;
}
