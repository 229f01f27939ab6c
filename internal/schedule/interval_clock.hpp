#pragma once

#include <chrono>

#include "internal/schedule/clock.hpp"

namespace flowsched::schedule {

// Fires at anchor + k * interval for every integer k.
class IntervalClock final : public Clock {
 public:
  // Throws util::InvalidArgument when interval is not positive.
  IntervalClock(util::TimePoint anchor, std::chrono::milliseconds interval);

  std::vector<util::TimePoint> GetDates(std::size_t n, util::TimePoint start, util::TimePoint end) const override;

  util::TimePoint Anchor() const {
    return anchor_;
  }

  std::chrono::milliseconds Interval() const {
    return interval_;
  }

 private:
  util::TimePoint           anchor_;
  std::chrono::milliseconds interval_;
};

} // namespace flowsched::schedule
