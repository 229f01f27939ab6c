#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/scheduler/occurrence_generator.hpp"
#include "internal/scheduler/run_materializer.hpp"

namespace flowsched::scheduler {

struct SweepOptions {
  // deployments read per transaction
  std::size_t page_size = 100;

  // per schedule; unset = kDefaultMaxRuns
  std::optional<std::size_t> max_runs;

  // window length; unset = one calendar year
  std::optional<std::chrono::milliseconds> horizon;
};

struct SweepResult {
  std::size_t deployments  = 0;
  std::size_t failures     = 0;
  std::size_t runs_created = 0;
};

/*
  SchedulerService

  Public entry point of the scheduling core.

  ScheduleRuns runs generation and materialization in one transaction
  and returns only the runs this call created. Calling it again with the
  same window returns nothing. Errors roll back and propagate; calling
  again is the recovery path.
*/
class SchedulerService {
 public:
  SchedulerService(std::shared_ptr<db::Repository> repository, std::shared_ptr<RunMaterializer> materializer);

  std::vector<db::model::FlowRunRecord> ScheduleRuns(const std::string& deployment_id,
                                                     std::optional<util::TimePoint> start = std::nullopt,
                                                     std::optional<util::TimePoint> end = std::nullopt,
                                                     std::optional<std::size_t> max_runs = std::nullopt);

  // Schedules every deployment. A failing deployment is logged and
  // counted; the sweep continues with the next one.
  SweepResult ScheduleAllDeployments(const SweepOptions& options = {});

 private:
  std::shared_ptr<db::Repository>  repository_;
  std::shared_ptr<RunMaterializer> materializer_;
  OccurrenceGenerator              generator_;
};

} // namespace flowsched::scheduler
