#pragma once

#include <cstdint>
#include <string>

namespace flowsched::db::model {

/*
  Persistent schedule row: an interval clock plus the parameters handed to
  every run it produces.
*/

struct ScheduleRecord {
  std::string id;
  std::string deployment_id;

  uint64_t interval_seconds = 0;
  int64_t  anchor_ms        = 0;

  // JSON object
  std::string parameters = "{}";

  uint64_t created_at_ms = 0;
};

}
