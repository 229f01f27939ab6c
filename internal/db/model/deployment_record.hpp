#pragma once

#include <cstdint>
#include <string>

namespace flowsched::db::model {

/*
  Persistent deployment row.

  A named binding of a flow to its schedules. The scheduling core only
  reads it.
*/

struct DeploymentRecord {
  std::string id;  // UUID text
  std::string name;
  std::string flow_id;

  uint64_t created_at_ms = 0;
};

}
