#include "time.hpp"

#include <cstdio>

namespace flowsched::util {

using namespace std::chrono;

TimePoint Now() {
  return time_point_cast<milliseconds>(Clock::now());
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = time_point_cast<seconds>(tp);
  if (sec > tp) sec -= seconds(1);
  auto nanos = duration_cast<nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + seconds(ts.seconds()) + duration_cast<milliseconds>(nanoseconds(ts.nanos()));
}

milliseconds ToDuration(const google::protobuf::Duration& d) {
  return seconds(d.seconds()) + duration_cast<milliseconds>(nanoseconds(d.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return static_cast<uint64_t>(tp.time_since_epoch().count());
}

TimePoint FromUnixMillis(int64_t ms) {
  return TimePoint{milliseconds(ms)};
}

TimePoint AddYears(TimePoint tp, int years_to_add) {
  const auto day       = floor<days>(tp);
  const auto time_part = tp - day;

  year_month_day ymd{day};
  auto shifted = ymd + years{years_to_add};
  if (!shifted.ok()) {
    shifted = shifted.year() / shifted.month() / last;
  }
  return time_point_cast<milliseconds>(sys_days{shifted}) + time_part;
}

std::string FormatRfc3339(TimePoint tp) {
  const auto day = floor<days>(tp);
  const year_month_day ymd{day};
  hh_mm_ss<milliseconds> hms{tp - day};

  char buf[64];
  const auto ms = hms.subseconds().count();
  if (ms != 0) {
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d.%03d+00:00", static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()), static_cast<int>(hms.hours().count()),
                  static_cast<int>(hms.minutes().count()), static_cast<int>(hms.seconds().count()), static_cast<int>(ms));
  } else {
    std::snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:%02d+00:00", static_cast<int>(ymd.year()),
                  static_cast<unsigned>(ymd.month()), static_cast<unsigned>(ymd.day()), static_cast<int>(hms.hours().count()),
                  static_cast<int>(hms.minutes().count()), static_cast<int>(hms.seconds().count()));
  }
  return buf;
}

std::optional<TimePoint> ParseRfc3339(const std::string& text) {
  int  y = 0, mo = 0, d = 0, h = 0, mi = 0, s = 0;
  int  consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &y, &mo, &d, &h, &mi, &s, &consumed) != 6) {
    return std::nullopt;
  }

  const year_month_day ymd{year{y}, month{static_cast<unsigned>(mo)}, day{static_cast<unsigned>(d)}};
  if (!ymd.ok() || h > 23 || mi > 59 || s > 60) {
    return std::nullopt;
  }

  std::size_t pos = static_cast<std::size_t>(consumed);
  int         millis = 0;
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    int digits = 0;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
      if (digits < 3) {
        millis = millis * 10 + (text[pos] - '0');
        ++digits;
      }
      ++pos;
    }
    if (digits == 0) return std::nullopt;
    while (digits++ < 3) millis *= 10;
  }

  minutes offset{0};
  if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
    ++pos;
  } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
    int oh = 0, om = 0;
    if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &oh, &om) != 2) {
      return std::nullopt;
    }
    offset = hours(oh) + minutes(om);
    if (text[pos] == '-') offset = -offset;
    pos += 6;
  } else {
    return std::nullopt;
  }

  if (pos != text.size()) {
    return std::nullopt;
  }

  return time_point_cast<milliseconds>(sys_days{ymd}) + hours(h) + minutes(mi) + seconds(s) + milliseconds(millis) - offset;
}

} // namespace flowsched::util
