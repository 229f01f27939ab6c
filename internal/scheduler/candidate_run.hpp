#pragma once

#include "internal/db/model/flow_run_record.hpp"
#include "internal/db/model/flow_run_state_record.hpp"
#include "internal/util/time.hpp"

namespace flowsched::scheduler {

/*
  One occurrence waiting to be materialized.

  run.id and initial_state.id are assigned at generation time and stay
  the same if the candidate is submitted again. initial_state.flow_run_id
  always equals run.id.
*/
struct CandidateRun {
  db::model::FlowRunRecord      run;
  db::model::FlowRunStateRecord initial_state;

  util::TimePoint scheduled_time;
};

} // namespace flowsched::scheduler
