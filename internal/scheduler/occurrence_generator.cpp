#include "internal/scheduler/occurrence_generator.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "flowsched/core/v1/types.pb.h"
#include "internal/schedule/clock_factory.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace flowsched::scheduler {

namespace {

std::string StateDetailsJson(const std::string& schedule_id, util::TimePoint scheduled_time) {
  flowsched::core::v1::StateDetails details;
  *details.mutable_scheduled_time() = util::ToProto(scheduled_time);
  details.set_schedule_id(schedule_id);
  details.set_auto_scheduled(true);

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(details, &json);
  if (!status.ok()) {
    throw std::runtime_error("serialize state details: " + std::string(status.message()));
  }
  return json;
}

std::string TagsJson() {
  return std::string("[\"") + kAutoScheduledTag + "\"]";
}

} // namespace

std::string IdempotencyKey(const std::string& schedule_id, util::TimePoint scheduled_time) {
  return "scheduled " + schedule_id + " " + util::FormatRfc3339(scheduled_time);
}

std::string RunId(const std::string& flow_id, const std::string& idempotency_key) {
  return util::ToString(util::NameBasedUUID("flow_run\n" + flow_id + "\n" + idempotency_key));
}

std::string InitialStateId(const std::string& run_id) {
  return util::ToString(util::NameBasedUUID("flow_run_state\n" + run_id));
}

OccurrenceGenerator::OccurrenceGenerator(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

std::vector<CandidateRun> OccurrenceGenerator::Generate(db::Transaction& tx, const std::string& deployment_id,
                                                        std::optional<util::TimePoint> start, std::optional<util::TimePoint> end,
                                                        std::optional<std::size_t> max_runs) const {
  auto deployment = repository_->GetDeployment(tx, deployment_id);
  if (!deployment.has_value()) {
    throw util::NotFound("deployment " + deployment_id + " not found");
  }

  const auto window_start = start.value_or(util::Now());
  const auto window_end   = end.value_or(util::AddYears(window_start, 1));
  const auto limit        = max_runs.value_or(kDefaultMaxRuns);

  std::vector<CandidateRun> candidates;
  const auto                created_at_ms = util::ToUnixMillis(util::Now());

  for (const auto& schedule : repository_->ListSchedules(tx, deployment_id)) {
    auto clock = schedule::BuildClock(schedule);

    for (const auto& scheduled_time : clock->GetDates(limit, window_start, window_end)) {
      CandidateRun candidate;
      candidate.scheduled_time = scheduled_time;

      auto& run           = candidate.run;
      run.idempotency_key = IdempotencyKey(schedule.id, scheduled_time);
      run.id              = RunId(deployment->flow_id, run.idempotency_key);
      run.flow_id         = deployment->flow_id;
      run.deployment_id   = deployment->id;
      run.parameters      = schedule.parameters;
      run.tags            = TagsJson();
      run.schedule_id     = schedule.id;
      run.auto_scheduled  = true;
      run.created_at_ms   = created_at_ms;

      auto& state         = candidate.initial_state;
      state.id            = InitialStateId(run.id);
      state.flow_run_id   = run.id;
      state.type          = flowsched::core::v1::STATE_TYPE_SCHEDULED;
      state.message       = kScheduledStateMessage;
      state.state_details = StateDetailsJson(schedule.id, scheduled_time);
      state.created_at_ms = created_at_ms;

      candidates.push_back(std::move(candidate));
    }
  }

  return candidates;
}

} // namespace flowsched::scheduler
