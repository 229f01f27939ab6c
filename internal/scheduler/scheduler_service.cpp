#include "internal/scheduler/scheduler_service.hpp"

#include <chrono>
#include <exception>

#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

namespace flowsched::scheduler {

namespace {

double ElapsedMs(std::chrono::steady_clock::time_point started) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
}

} // namespace

SchedulerService::SchedulerService(std::shared_ptr<db::Repository> repository, std::shared_ptr<RunMaterializer> materializer)
    : repository_(std::move(repository)), materializer_(std::move(materializer)), generator_(repository_) {
}

std::vector<db::model::FlowRunRecord> SchedulerService::ScheduleRuns(const std::string& deployment_id,
                                                                     std::optional<util::TimePoint> start,
                                                                     std::optional<util::TimePoint> end,
                                                                     std::optional<std::size_t> max_runs) {
  auto& metrics = observability::Metrics::Instance();
  const auto started = std::chrono::steady_clock::now();

  try {
    auto tx         = repository_->Begin();
    auto candidates = generator_.Generate(*tx, deployment_id, start, end, max_runs);
    auto created    = materializer_->Materialize(*tx, candidates);
    tx->Commit();

    metrics.AddCandidates(candidates.size());
    metrics.AddMaterialized(created.size());
    metrics.ObserveScheduleLatencyMs(ElapsedMs(started), true);

    FLOWSCHED_LOG_INFO("scheduled runs", {observability::StringField("deployment_id", deployment_id),
                                          observability::IntField("candidates", static_cast<int64_t>(candidates.size())),
                                          observability::IntField("created", static_cast<int64_t>(created.size()))});
    return created;
  } catch (const std::exception&) {
    metrics.ObserveScheduleLatencyMs(ElapsedMs(started), false);
    throw;
  }
}

SweepResult SchedulerService::ScheduleAllDeployments(const SweepOptions& options) {
  SweepResult result;
  const auto  page_size = options.page_size == 0 ? SweepOptions{}.page_size : options.page_size;

  std::optional<util::TimePoint> start;
  std::optional<util::TimePoint> end;
  if (options.horizon.has_value()) {
    start = util::Now();
    end   = *start + *options.horizon;
  }

  uint64_t offset = 0;
  for (;;) {
    std::vector<db::model::DeploymentRecord> page;
    {
      auto tx = repository_->Begin();
      page    = repository_->ListDeployments(*tx, offset, page_size);
      tx->Commit();
    }

    for (const auto& deployment : page) {
      ++result.deployments;
      try {
        result.runs_created += ScheduleRuns(deployment.id, start, end, options.max_runs).size();
      } catch (const std::exception& e) {
        ++result.failures;
        FLOWSCHED_LOG_ERROR("scheduling deployment failed",
                            {observability::StringField("deployment_id", deployment.id), observability::StringField("error", e.what())});
      }
    }

    if (page.size() < page_size) {
      break;
    }
    offset += page.size();
  }

  FLOWSCHED_LOG_INFO("schedule sweep finished", {observability::IntField("deployments", static_cast<int64_t>(result.deployments)),
                                                 observability::IntField("failures", static_cast<int64_t>(result.failures)),
                                                 observability::IntField("runs_created", static_cast<int64_t>(result.runs_created))});
  return result;
}

} // namespace flowsched::scheduler
