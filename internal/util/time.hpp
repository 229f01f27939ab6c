#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace flowsched::util {

/*
  Time utilities. Single place to control the clock source.

  All persisted timestamps are UTC unix milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = std::chrono::time_point<Clock, std::chrono::milliseconds>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

std::chrono::milliseconds ToDuration(const google::protobuf::Duration& d);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

// Calendar addition; Feb 29 lands on Feb 28 in non-leap years.
TimePoint AddYears(TimePoint tp, int years);

// "2024-01-01T00:00:00+00:00", millisecond suffix only when non-zero.
std::string FormatRfc3339(TimePoint tp);

// Accepts "YYYY-MM-DDTHH:MM:SS[.fff](Z|+HH:MM|-HH:MM)".
std::optional<TimePoint> ParseRfc3339(const std::string& text);

} // namespace flowsched::util
