#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/scheduler/candidate_run.hpp"

namespace flowsched::scheduler {

inline constexpr std::size_t kDefaultMaxRuns = 100;

inline constexpr const char* kAutoScheduledTag     = "auto-scheduled";
inline constexpr const char* kScheduledStateMessage = "Flow run scheduled";

// "scheduled <schedule id> <RFC3339 UTC time>"
std::string IdempotencyKey(const std::string& schedule_id, util::TimePoint scheduled_time);

// Identities are derived from the occurrence, so regenerating it after a
// failed attempt addresses the rows that attempt left behind.
std::string RunId(const std::string& flow_id, const std::string& idempotency_key);
std::string InitialStateId(const std::string& run_id);

/*
  OccurrenceGenerator

  Expands every schedule of a deployment into candidate runs.

  Defaults, each applied on its own:
    start    = now
    end      = start + 1 calendar year
    max_runs = kDefaultMaxRuns, per schedule

  Reads only; nothing is written through `tx`.
*/
class OccurrenceGenerator {
 public:
  explicit OccurrenceGenerator(std::shared_ptr<db::Repository> repository);

  // Throws util::NotFound if the deployment does not exist.
  std::vector<CandidateRun> Generate(db::Transaction& tx, const std::string& deployment_id,
                                     std::optional<util::TimePoint> start = std::nullopt,
                                     std::optional<util::TimePoint> end = std::nullopt,
                                     std::optional<std::size_t> max_runs = std::nullopt) const;

 private:
  std::shared_ptr<db::Repository> repository_;
};

} // namespace flowsched::scheduler
