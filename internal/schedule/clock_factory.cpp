#include "internal/schedule/clock_factory.hpp"

#include <limits>

#include "internal/schedule/interval_clock.hpp"
#include "internal/util/errors.hpp"

namespace flowsched::schedule {

std::unique_ptr<Clock> BuildClock(const db::model::ScheduleRecord& schedule) {
  constexpr uint64_t kMaxIntervalSeconds = static_cast<uint64_t>(std::numeric_limits<int64_t>::max() / 1000);

  if (schedule.interval_seconds == 0 || schedule.interval_seconds > kMaxIntervalSeconds) {
    throw util::InvalidArgument("schedule " + schedule.id + " has an invalid interval");
  }

  return std::make_unique<IntervalClock>(util::FromUnixMillis(schedule.anchor_ms),
                                         std::chrono::seconds(static_cast<int64_t>(schedule.interval_seconds)));
}

} // namespace flowsched::schedule
