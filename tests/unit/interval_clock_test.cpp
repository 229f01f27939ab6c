#include "internal/schedule/clock_factory.hpp"
#include "internal/schedule/interval_clock.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using flowsched::schedule::IntervalClock;
using flowsched::util::TimePoint;
using namespace std::chrono_literals;

TimePoint T0() {
  return *flowsched::util::ParseRfc3339("2024-01-01T00:00:00Z");
}

void TestAnchorInsideWindow() {
  IntervalClock clock(T0(), 1h);

  auto dates = clock.GetDates(10, T0(), T0() + 2h);
  assert(dates.size() == 3);
  assert(dates[0] == T0());
  assert(dates[1] == T0() + 1h);
  assert(dates[2] == T0() + 2h);
}

void TestAnchorBeforeWindowAlignsToGrid() {
  IntervalClock clock(T0(), 1h);

  auto dates = clock.GetDates(10, T0() + 30min, T0() + 3h + 30min);
  assert(dates.size() == 3);
  assert(dates[0] == T0() + 1h);
  assert(dates[2] == T0() + 3h);
}

void TestAnchorAfterWindowStillEmitsEarlierOccurrences() {
  IntervalClock clock(T0() + 24h, 6h);

  auto dates = clock.GetDates(10, T0() + 1h, T0() + 13h);
  assert(dates.size() == 2);
  assert(dates[0] == T0() + 6h);
  assert(dates[1] == T0() + 12h);
}

void TestCountLimitKeepsEarliest() {
  IntervalClock clock(T0(), 1min);

  auto dates = clock.GetDates(5, T0(), T0() + 24h);
  assert(dates.size() == 5);
  for (std::size_t i = 1; i < dates.size(); ++i) {
    assert(dates[i - 1] < dates[i]);
  }
  assert(dates.back() == T0() + 4min);

  assert(clock.GetDates(0, T0(), T0() + 24h).empty());
}

void TestEmptyOrInvertedWindow() {
  IntervalClock clock(T0(), 1h);

  assert(clock.GetDates(10, T0() + 1h, T0()).empty());
  assert(clock.GetDates(10, T0() + 10min, T0() + 20min).empty());

  auto single = clock.GetDates(10, T0() + 1h, T0() + 1h);
  assert(single.size() == 1);
}

void TestDeterministic() {
  IntervalClock clock(T0() + 7s, 90s);

  auto first  = clock.GetDates(50, T0(), T0() + 1h);
  auto second = clock.GetDates(50, T0(), T0() + 1h);
  assert(first == second);
}

void TestNonPositiveIntervalRejected() {
  bool threw = false;
  try {
    IntervalClock clock(T0(), 0ms);
  } catch (const flowsched::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestBuildClockFromSchedule() {
  flowsched::db::model::ScheduleRecord schedule;
  schedule.id               = "s1";
  schedule.interval_seconds = 3600;
  schedule.anchor_ms        = static_cast<int64_t>(flowsched::util::ToUnixMillis(T0()));

  auto clock = flowsched::schedule::BuildClock(schedule);
  auto dates = clock->GetDates(2, T0() + 1min, T0() + 24h);
  assert(dates.size() == 2);
  assert(dates[0] == T0() + 1h);

  schedule.interval_seconds = 0;
  bool threw = false;
  try {
    (void)flowsched::schedule::BuildClock(schedule);
  } catch (const flowsched::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  schedule.interval_seconds = std::numeric_limits<uint64_t>::max();
  threw                     = false;
  try {
    (void)flowsched::schedule::BuildClock(schedule);
  } catch (const flowsched::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestAnchorInsideWindow();
  TestAnchorBeforeWindowAlignsToGrid();
  TestAnchorAfterWindowStillEmitsEarlierOccurrences();
  TestCountLimitKeepsEarliest();
  TestEmptyOrInvertedWindow();
  TestDeterministic();
  TestNonPositiveIntervalRejected();
  TestBuildClockFromSchedule();

  std::cout << "flowsched_unit_interval_clock: pass\n";
  return 0;
}
