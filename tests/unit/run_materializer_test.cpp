#include "internal/scheduler/run_materializer.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/scheduler/occurrence_generator.hpp"
#include "internal/util/time.hpp"

namespace {

using flowsched::db::StateLinkStrategy;
using flowsched::db::memory::MemoryRepository;
using flowsched::scheduler::CandidateRun;
using flowsched::scheduler::OccurrenceGenerator;
using flowsched::scheduler::RunMaterializer;
using flowsched::util::TimePoint;
using namespace std::chrono_literals;

// memory evaluates each strategy on its own path; the SQL statements are
// covered by the integration suite
constexpr StateLinkStrategy kStrategies[] = {StateLinkStrategy::kUpdateJoin, StateLinkStrategy::kCorrelatedSubquery};

TimePoint T0() {
  return *flowsched::util::ParseRfc3339("2024-01-01T00:00:00Z");
}

std::shared_ptr<MemoryRepository> MakeRepository() {
  auto repo = std::make_shared<MemoryRepository>();

  flowsched::db::model::DeploymentRecord deployment;
  deployment.id      = "d1";
  deployment.name    = "hourly";
  deployment.flow_id = "flow-1";

  flowsched::db::model::ScheduleRecord schedule;
  schedule.id               = "s1";
  schedule.deployment_id    = "d1";
  schedule.interval_seconds = 3600;
  schedule.anchor_ms        = static_cast<int64_t>(flowsched::util::ToUnixMillis(T0()));

  auto tx = repo->Begin();
  assert(repo->InsertDeployment(*tx, deployment));
  assert(repo->InsertSchedule(*tx, schedule));
  tx->Commit();
  return repo;
}

std::vector<CandidateRun> Candidates(const std::shared_ptr<MemoryRepository>& repo, std::size_t max_runs) {
  OccurrenceGenerator generator(repo);
  auto                tx = repo->Begin();
  return generator.Generate(*tx, "d1", T0(), T0() + 24h, max_runs);
}

std::vector<flowsched::db::model::FlowRunRecord> Materialize(const std::shared_ptr<MemoryRepository>& repo, StateLinkStrategy strategy,
                                                             const std::vector<CandidateRun>& candidates) {
  RunMaterializer materializer(repo, strategy);
  auto            tx      = repo->Begin();
  auto            created = materializer.Materialize(*tx, candidates);
  tx->Commit();
  return created;
}

// every run of d1 has exactly one state and points at it
void CheckAllLinked(const std::shared_ptr<MemoryRepository>& repo) {
  auto tx = repo->Begin();
  for (const auto& run : repo->ListFlowRuns(*tx, "d1")) {
    auto states = repo->ListFlowRunStates(*tx, run.id);
    assert(states.size() == 1);
    assert(run.state_id.has_value());
    assert(*run.state_id == states[0].id);
    assert(states[0].type == flowsched::core::v1::STATE_TYPE_SCHEDULED);
  }
}

std::size_t RunCount(const std::shared_ptr<MemoryRepository>& repo) {
  auto tx = repo->Begin();
  return repo->ListFlowRuns(*tx, "d1").size();
}

void TestEmptyInput() {
  for (auto strategy : kStrategies) {
    auto repo = MakeRepository();
    assert(Materialize(repo, strategy, {}).empty());
    assert(RunCount(repo) == 0);
  }
}

void TestFirstCallCreatesAndLinksEverything() {
  for (auto strategy : kStrategies) {
    auto repo       = MakeRepository();
    auto candidates = Candidates(repo, 5);
    auto created    = Materialize(repo, strategy, candidates);

    assert(created.size() == 5);
    for (std::size_t i = 0; i < created.size(); ++i) {
      assert(created[i].id == candidates[i].run.id);
      assert(created[i].state_id.has_value());
      assert(*created[i].state_id == candidates[i].initial_state.id);
    }
    assert(RunCount(repo) == 5);
    CheckAllLinked(repo);
  }
}

void TestSecondCallCreatesNothing() {
  for (auto strategy : kStrategies) {
    auto repo       = MakeRepository();
    auto candidates = Candidates(repo, 5);
    assert(Materialize(repo, strategy, candidates).size() == 5);
    assert(Materialize(repo, strategy, candidates).empty());
    assert(RunCount(repo) == 5);
    CheckAllLinked(repo);
  }
}

void TestExistingStatefulRunIsUntouched() {
  for (auto strategy : kStrategies) {
    auto repo       = MakeRepository();
    auto candidates = Candidates(repo, 3);

    // an earlier run that already moved on with a different state
    {
      auto run = candidates[0].run;
      flowsched::db::model::FlowRunStateRecord state;
      state.id          = "pending-state";
      state.flow_run_id = run.id;
      state.type        = flowsched::core::v1::STATE_TYPE_PENDING;
      state.message     = "picked up";

      auto tx = repo->Begin();
      assert(repo->InsertFlowRunsIgnoreConflicts(*tx, {run}));
      assert(repo->InsertFlowRunStates(*tx, {state}));
      assert(repo->LinkFlowRunStates(*tx, StateLinkStrategy::kUpdateJoin, {state.id}));
      tx->Commit();
    }

    auto created = Materialize(repo, strategy, candidates);
    assert(created.size() == 2);
    for (const auto& run : created) assert(run.id != candidates[0].run.id);

    auto tx     = repo->Begin();
    auto kept   = repo->GetFlowRun(*tx, candidates[0].run.id);
    auto states = repo->ListFlowRunStates(*tx, candidates[0].run.id);
    assert(kept.has_value());
    assert(kept->state_id == std::optional<std::string>("pending-state"));
    assert(states.size() == 1);
    assert(states[0].type == flowsched::core::v1::STATE_TYPE_PENDING);
  }
}

void TestStatelessLeftoversAreRecovered() {
  for (auto strategy : kStrategies) {
    auto repo       = MakeRepository();
    auto candidates = Candidates(repo, 4);

    // runs persisted by an attempt that never got to write their states
    {
      std::vector<flowsched::db::model::FlowRunRecord> leftovers = {candidates[0].run, candidates[2].run};
      auto                                             tx        = repo->Begin();
      assert(repo->InsertFlowRunsIgnoreConflicts(*tx, leftovers));
      tx->Commit();
    }

    auto created = Materialize(repo, strategy, candidates);
    assert(created.size() == 4);
    assert(RunCount(repo) == 4);
    CheckAllLinked(repo);
  }
}

void TestDuplicateCandidateYieldsOneRun() {
  for (auto strategy : kStrategies) {
    auto repo       = MakeRepository();
    auto candidates = Candidates(repo, 2);
    candidates.push_back(candidates[0]);

    auto created = Materialize(repo, strategy, candidates);
    assert(created.size() == 2);

    std::set<std::string> ids;
    for (const auto& run : created) ids.insert(run.id);
    assert(ids.size() == 2);
    CheckAllLinked(repo);
  }
}

void TestRolledBackAttemptLeavesNothing() {
  for (auto strategy : kStrategies) {
    auto            repo       = MakeRepository();
    auto            candidates = Candidates(repo, 3);
    RunMaterializer materializer(repo, strategy);
    {
      auto tx = repo->Begin();
      assert(materializer.Materialize(*tx, candidates).size() == 3);
      tx->Rollback();
    }
    assert(RunCount(repo) == 0);
    assert(Materialize(repo, strategy, candidates).size() == 3);
  }
}

void TestLinkTouchesOnlyOwnersOfGivenStates() {
  for (auto strategy : kStrategies) {
    auto repo       = MakeRepository();
    auto candidates = Candidates(repo, 3);

    std::vector<flowsched::db::model::FlowRunRecord>      runs;
    std::vector<flowsched::db::model::FlowRunStateRecord> states;
    for (const auto& candidate : candidates) {
      runs.push_back(candidate.run);
      states.push_back(candidate.initial_state);
    }

    auto tx = repo->Begin();
    assert(repo->InsertFlowRunsIgnoreConflicts(*tx, runs));
    assert(repo->InsertFlowRunStates(*tx, states));
    assert(repo->LinkFlowRunStates(*tx, strategy, {states[1].id, "unknown-state"}));

    assert(!repo->GetFlowRun(*tx, runs[0].id)->state_id.has_value());
    assert(repo->GetFlowRun(*tx, runs[1].id)->state_id == std::optional<std::string>(states[1].id));
    assert(!repo->GetFlowRun(*tx, runs[2].id)->state_id.has_value());
    tx->Commit();
  }
}

} // namespace

int main() {
  TestEmptyInput();
  TestFirstCallCreatesAndLinksEverything();
  TestSecondCallCreatesNothing();
  TestExistingStatefulRunIsUntouched();
  TestStatelessLeftoversAreRecovered();
  TestDuplicateCandidateYieldsOneRun();
  TestRolledBackAttemptLeavesNothing();
  TestLinkTouchesOnlyOwnersOfGivenStates();

  std::cout << "flowsched_unit_run_materializer: pass\n";
  return 0;
}
