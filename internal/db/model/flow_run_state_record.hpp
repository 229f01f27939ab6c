#pragma once

#include <cstdint>
#include <string>

#include "flowsched/core/v1/types.pb.h"

namespace flowsched::db::model {

struct FlowRunStateRecord {
  std::string id;
  std::string flow_run_id;

  flowsched::core::v1::StateType type = flowsched::core::v1::STATE_TYPE_UNSPECIFIED;

  std::string message;

  // JSON object (serialized flowsched.core.v1.StateDetails)
  std::string state_details = "{}";

  uint64_t created_at_ms = 0;
};

}
