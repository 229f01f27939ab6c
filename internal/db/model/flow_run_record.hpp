#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace flowsched::db::model {

/*
  Persistent flow run row.

  IMPORTANT:
  - id is assigned by the client before insertion, never by the DB.
  - (flow_id, idempotency_key) is unique; it is the only duplicate guard.
  - state_id stays empty until the run's initial state has been linked.
*/

struct FlowRunRecord {
  std::string id;
  std::string flow_id;
  std::string deployment_id;

  // JSON object
  std::string parameters = "{}";

  std::string idempotency_key;

  // JSON array of strings
  std::string tags = "[]";

  // run details
  std::string schedule_id;
  bool        auto_scheduled = false;

  std::optional<std::string> state_id;

  uint64_t created_at_ms = 0;
};

}
