#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/scheduler/occurrence_generator.hpp"
#include "internal/scheduler/run_materializer.hpp"
#include "internal/scheduler/scheduler_service.hpp"
#include "internal/util/time.hpp"

#if FLOWSCHED_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if FLOWSCHED_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using flowsched::db::Repository;
using flowsched::db::StateLinkStrategy;
using flowsched::db::memory::MemoryRepository;
using flowsched::scheduler::OccurrenceGenerator;
using flowsched::scheduler::RunMaterializer;
using flowsched::scheduler::SchedulerService;
using flowsched::util::TimePoint;
using namespace std::chrono_literals;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

TimePoint T0() {
  return *flowsched::util::ParseRfc3339("2024-01-01T00:00:00Z");
}

struct BackendFactory {
  std::string                                   name;
  std::function<std::shared_ptr<Repository>()>  make_repository;
  // a second connection to the same database; empty when the backend has
  // no separate connections
  std::function<std::shared_ptr<Repository>()>  make_peer;
  std::vector<StateLinkStrategy>                strategies;
  std::function<void()>                         cleanup;
};

// Unique per run so a shared postgres database can be reused.
std::string Unique(const BackendFactory& backend, const std::string& suffix) {
  static std::atomic<uint64_t> counter{0};
  return backend.name + "-" + std::to_string(NowMs()) + "-" + std::to_string(counter++) + "-" + suffix;
}

void AddDeployment(Repository& repo, const std::string& id, uint64_t interval_seconds) {
  flowsched::db::model::DeploymentRecord deployment;
  deployment.id      = id;
  deployment.name    = id;
  deployment.flow_id = "flow-" + id;

  flowsched::db::model::ScheduleRecord schedule;
  schedule.id               = "schedule-" + id;
  schedule.deployment_id    = id;
  schedule.interval_seconds = interval_seconds;
  schedule.anchor_ms        = static_cast<int64_t>(flowsched::util::ToUnixMillis(T0()));
  schedule.parameters       = R"({"source":"integration"})";

  auto tx = repo.Begin();
  auto r  = repo.InsertDeployment(*tx, deployment);
  assert(r);
  r = repo.InsertSchedule(*tx, schedule);
  assert(r);
  tx->Commit();
}

// Every run of the deployment owns exactly one state and points at it.
std::size_t CheckRuns(Repository& repo, const std::string& deployment_id) {
  auto tx   = repo.Begin();
  auto runs = repo.ListFlowRuns(*tx, deployment_id);

  std::set<std::string> keys;
  for (const auto& run : runs) {
    assert(keys.insert(run.idempotency_key).second);
    assert(run.state_id.has_value());
    auto states = repo.ListFlowRunStates(*tx, run.id);
    assert(states.size() == 1);
    assert(states[0].id == *run.state_id);
    assert(states[0].type == flowsched::core::v1::STATE_TYPE_SCHEDULED);
    assert(states[0].message == flowsched::scheduler::kScheduledStateMessage);
  }
  tx->Commit();
  return runs.size();
}

void VerifyIdempotentScheduling(const BackendFactory& backend, const std::shared_ptr<Repository>& repo, StateLinkStrategy strategy) {
  const auto id = Unique(backend, "idempotent");
  AddDeployment(*repo, id, 3600);

  SchedulerService service(repo, std::make_shared<RunMaterializer>(repo, strategy));

  auto first = service.ScheduleRuns(id, T0(), T0() + 2h, 10);
  assert(first.size() == 3);
  for (const auto& run : first) {
    assert(run.state_id.has_value());
    assert(run.tags == R"(["auto-scheduled"])");
  }

  assert(service.ScheduleRuns(id, T0(), T0() + 2h, 10).empty());
  assert(service.ScheduleRuns(id, T0(), T0() + 2h, 1).empty());
  assert(CheckRuns(*repo, id) == 3);

  auto tx  = repo->Begin();
  auto run = repo->GetFlowRun(*tx, first[0].id);
  assert(run.has_value());
  assert(run->flow_id == "flow-" + id);
  assert(run->schedule_id == "schedule-" + id);
  assert(run->auto_scheduled);
  assert(run->idempotency_key == first[0].idempotency_key);
  tx->Commit();
}

void VerifyPartialRecovery(const BackendFactory& backend, const std::shared_ptr<Repository>& repo, StateLinkStrategy strategy) {
  const auto id = Unique(backend, "partial");
  AddDeployment(*repo, id, 3600);

  {
    OccurrenceGenerator generator(repo);
    auto                tx         = repo->Begin();
    auto                candidates = generator.Generate(*tx, id, T0(), T0() + 7h, 10);
    assert(candidates.size() == 8);

    std::vector<flowsched::db::model::FlowRunRecord> leftovers;
    for (std::size_t i = 1; i < candidates.size(); i += 2) leftovers.push_back(candidates[i].run);
    auto r = repo->InsertFlowRunsIgnoreConflicts(*tx, leftovers);
    assert(r);
    tx->Commit();
  }

  SchedulerService service(repo, std::make_shared<RunMaterializer>(repo, strategy));
  assert(service.ScheduleRuns(id, T0(), T0() + 7h, 10).size() == 8);
  assert(CheckRuns(*repo, id) == 8);
}

void VerifyLinkLeavesOtherRunsAlone(const BackendFactory& backend, const std::shared_ptr<Repository>& repo, StateLinkStrategy strategy) {
  const auto id = Unique(backend, "untouched");
  AddDeployment(*repo, id, 3600);

  OccurrenceGenerator generator(repo);
  std::string         pending_run_id;
  const std::string   pending_state_id = Unique(backend, "pending-state");
  {
    auto tx         = repo->Begin();
    auto candidates = generator.Generate(*tx, id, T0(), T0(), 1);
    assert(candidates.size() == 1);
    pending_run_id = candidates[0].run.id;

    flowsched::db::model::FlowRunStateRecord state;
    state.id            = pending_state_id;
    state.flow_run_id   = pending_run_id;
    state.type          = flowsched::core::v1::STATE_TYPE_PENDING;
    state.message       = "picked up";
    state.created_at_ms = NowMs();

    auto r = repo->InsertFlowRunsIgnoreConflicts(*tx, {candidates[0].run});
    assert(r);
    r = repo->InsertFlowRunStates(*tx, {state});
    assert(r);
    r = repo->LinkFlowRunStates(*tx, strategy, {state.id});
    assert(r);
    tx->Commit();
  }

  RunMaterializer materializer(repo, strategy);
  auto            tx         = repo->Begin();
  auto            candidates = generator.Generate(*tx, id, T0(), T0() + 3h, 10);
  auto            created    = materializer.Materialize(*tx, candidates);
  assert(created.size() == 3);

  auto pending = repo->GetFlowRun(*tx, pending_run_id);
  assert(pending.has_value());
  assert(pending->state_id == std::optional<std::string>(pending_state_id));
  assert(repo->ListFlowRunStates(*tx, pending_run_id).size() == 1);
  tx->Commit();
}

void VerifyLargeBatch(const BackendFactory& backend, const std::shared_ptr<Repository>& repo, StateLinkStrategy strategy) {
  const auto id = Unique(backend, "large");
  AddDeployment(*repo, id, 60);

  SchedulerService service(repo, std::make_shared<RunMaterializer>(repo, strategy));
  auto             created = service.ScheduleRuns(id, T0(), T0() + 24h, 1000);
  assert(created.size() == 1000);
  assert(service.ScheduleRuns(id, T0(), T0() + 24h, 1000).empty());
  assert(CheckRuns(*repo, id) == 1000);
}

void VerifyRollbackLeavesNothing(const BackendFactory& backend, const std::shared_ptr<Repository>& repo, StateLinkStrategy strategy) {
  const auto id = Unique(backend, "rollback");
  AddDeployment(*repo, id, 3600);

  OccurrenceGenerator generator(repo);
  RunMaterializer     materializer(repo, strategy);
  {
    auto tx = repo->Begin();
    assert(materializer.Materialize(*tx, generator.Generate(*tx, id, T0(), T0() + 2h, 10)).size() == 3);
    tx->Rollback();
  }
  assert(CheckRuns(*repo, id) == 0);
}

// Races two ScheduleRuns calls for the same deployment and checks that the
// loser returns nothing instead of failing.
void RaceSameDeployment(SchedulerService& left, SchedulerService& right, Repository& repo, const std::string& id) {
  std::atomic<std::size_t> created{0};
  std::atomic<std::size_t> failed{0};
  auto                     schedule = [&](SchedulerService& service) {
    try {
      created += service.ScheduleRuns(id, T0(), T0() + 24h, 100).size();
    } catch (const std::exception& e) {
      std::cout << "  concurrent ScheduleRuns threw: " << e.what() << "\n";
      ++failed;
    }
  };

  std::thread a(schedule, std::ref(left));
  std::thread b(schedule, std::ref(right));
  a.join();
  b.join();

  assert(failed.load() == 0);
  assert(created.load() == 100);
  assert(CheckRuns(repo, id) == 100);
}

void VerifyConcurrentSchedulers(const BackendFactory& backend, const std::shared_ptr<Repository>& repo, StateLinkStrategy strategy) {
  if (!backend.make_peer) {
    std::cout << "  no second connection for " << backend.name << "\n";
    return;
  }

  const auto id = Unique(backend, "race");
  AddDeployment(*repo, id, 600);

  auto peer = backend.make_peer();

  SchedulerService left(repo, std::make_shared<RunMaterializer>(repo, strategy));
  SchedulerService right(peer, std::make_shared<RunMaterializer>(peer, strategy));
  RaceSameDeployment(left, right, *repo, id);
}

// A periodic sweep and a manual trigger share one repository and one
// service.
void VerifySharedRepositoryRace(const BackendFactory& backend, const std::shared_ptr<Repository>& repo, StateLinkStrategy strategy) {
  const auto id = Unique(backend, "shared-race");
  AddDeployment(*repo, id, 600);

  SchedulerService service(repo, std::make_shared<RunMaterializer>(repo, strategy));
  RaceSameDeployment(service, service, *repo, id);
}

void VerifySharedRepositoryDisjointDeployments(const BackendFactory& backend, const std::shared_ptr<Repository>& repo,
                                               StateLinkStrategy strategy) {
  const auto first  = Unique(backend, "disjoint-a");
  const auto second = Unique(backend, "disjoint-b");
  AddDeployment(*repo, first, 600);
  AddDeployment(*repo, second, 600);

  SchedulerService service(repo, std::make_shared<RunMaterializer>(repo, strategy));

  std::atomic<std::size_t> failed{0};
  std::atomic<std::size_t> created{0};
  auto                     schedule = [&](const std::string& id) {
    for (int round = 0; round < 10; ++round) {
      try {
        created += service.ScheduleRuns(id, T0(), T0() + 24h, 50).size();
      } catch (const std::exception& e) {
        std::cout << "  concurrent ScheduleRuns threw: " << e.what() << "\n";
        ++failed;
      }
    }
  };

  std::thread a(schedule, first);
  std::thread b(schedule, second);
  a.join();
  b.join();

  assert(failed.load() == 0);
  assert(created.load() == 100);
  assert(CheckRuns(*repo, first) == 50);
  assert(CheckRuns(*repo, second) == 50);
}

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  for (auto strategy : backend.strategies) {
    VerifyIdempotentScheduling(backend, repo, strategy);
    VerifyPartialRecovery(backend, repo, strategy);
    VerifyLinkLeavesOtherRunsAlone(backend, repo, strategy);
    VerifyLargeBatch(backend, repo, strategy);
    VerifyRollbackLeavesNothing(backend, repo, strategy);
    VerifyConcurrentSchedulers(backend, repo, strategy);
    VerifySharedRepositoryRace(backend, repo, strategy);
    VerifySharedRepositoryDisjointDeployments(backend, repo, strategy);
  }

  repo.reset();
  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name            = "memory",
      .make_repository = []() { return std::make_shared<MemoryRepository>(); },
      .make_peer       = nullptr,
      .strategies      = {StateLinkStrategy::kUpdateJoin, StateLinkStrategy::kCorrelatedSubquery},
      .cleanup         = []() {},
  };
}

#if FLOWSCHED_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("flowsched_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<flowsched::db::sqlite::SqliteDB>(db_path);
    db->Bootstrap();
    return std::make_shared<flowsched::db::sqlite::SqliteRepository>(std::move(db));
  };

  std::vector<StateLinkStrategy> strategies = {StateLinkStrategy::kCorrelatedSubquery};
  if (flowsched::db::sqlite::SqliteRepository::SupportsUpdateJoin()) {
    strategies.push_back(StateLinkStrategy::kUpdateJoin);
  } else {
    std::cout << "sqlite library predates UPDATE ... FROM; update-join not exercised\n";
  }

  return BackendFactory{
      .name            = "sqlite",
      .make_repository = make_repo,
      .make_peer       = make_repo,
      .strategies      = strategies,
      .cleanup         = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}

void VerifySqliteRejectsUnavailableUpdateJoin() {
  if (flowsched::db::sqlite::SqliteRepository::SupportsUpdateJoin()) {
    return;
  }
  auto db_path = (std::filesystem::temp_directory_path() / ("flowsched_integration_sqlite_old_" + std::to_string(NowMs()) + ".db")).string();
  {
    auto db = std::make_shared<flowsched::db::sqlite::SqliteDB>(db_path);
    db->Bootstrap();
    flowsched::db::sqlite::SqliteRepository repo(db);

    auto tx = repo.Begin();
    auto r  = repo.LinkFlowRunStates(*tx, StateLinkStrategy::kUpdateJoin, {"state"});
    assert(r.code == flowsched::db::ErrorCode::Unsupported);
    tx->Rollback();
  }
  std::filesystem::remove(db_path);
}
#endif

#if FLOWSCHED_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("FLOWSCHED_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("FLOWSCHED_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() -> std::shared_ptr<Repository> {
    auto pool = std::make_shared<flowsched::db::postgres::PgPool>(conninfo, 4);
    pool->Bootstrap();
    return std::make_shared<flowsched::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name            = "postgres",
      .make_repository = make_repo,
      .make_peer       = make_repo,
      .strategies      = {StateLinkStrategy::kUpdateJoin, StateLinkStrategy::kCorrelatedSubquery},
      .cleanup         = []() {},
  };
}
#endif

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if FLOWSCHED_DB_SQLITE
  VerifySqliteRejectsUnavailableUpdateJoin();
  backends.push_back(MakeSqliteFactory());
#endif

#if FLOWSCHED_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "flowsched_integration_materializer_parity: pass\n";
  return 0;
}
