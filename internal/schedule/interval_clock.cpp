#include "internal/schedule/interval_clock.hpp"

#include "internal/util/errors.hpp"

namespace flowsched::schedule {

IntervalClock::IntervalClock(util::TimePoint anchor, std::chrono::milliseconds interval) : anchor_(anchor), interval_(interval) {
  if (interval_.count() <= 0) {
    throw util::InvalidArgument("interval must be positive");
  }
}

std::vector<util::TimePoint> IntervalClock::GetDates(std::size_t n, util::TimePoint start, util::TimePoint end) const {
  std::vector<util::TimePoint> out;
  if (n == 0 || end < start) {
    return out;
  }

  // first k with anchor + k * interval >= start
  const int64_t step = interval_.count();
  const int64_t diff = (start - anchor_).count();
  int64_t       k    = diff > 0 ? (diff + step - 1) / step : diff / step;

  for (auto t = anchor_ + std::chrono::milliseconds(k * step); t <= end && out.size() < n; t += interval_) {
    out.push_back(t);
  }
  return out;
}

} // namespace flowsched::schedule
