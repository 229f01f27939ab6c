#pragma once

#include <cstddef>
#include <vector>

#include "internal/util/time.hpp"

namespace flowsched::schedule {

/*
  Clock

  Expands a schedule into concrete occurrence times.

  Contract:
    - at most n results
    - every result lies in [start, end]
    - strictly increasing
    - same inputs, same output (no wall-clock reads)
*/
class Clock {
 public:
  virtual ~Clock() = default;

  virtual std::vector<util::TimePoint> GetDates(std::size_t n, util::TimePoint start, util::TimePoint end) const = 0;
};

} // namespace flowsched::schedule
