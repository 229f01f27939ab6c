#pragma once

#include <memory>

#include "internal/db/model/schedule_record.hpp"
#include "internal/schedule/clock.hpp"

namespace flowsched::schedule {

// Clock for a persisted schedule row. Throws util::InvalidArgument for a
// row that describes no valid recurrence.
std::unique_ptr<Clock> BuildClock(const db::model::ScheduleRecord& schedule);

} // namespace flowsched::schedule
