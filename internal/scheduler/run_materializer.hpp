#pragma once

#include <memory>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/scheduler/candidate_run.hpp"

namespace flowsched::scheduler {

/*
  RunMaterializer

  Persists candidate runs exactly once, each with one SCHEDULED state.

  Protocol, all through the caller's transaction:
    1. insert runs, ignoring (flow_id, idempotency_key) conflicts
    2. among the submitted ids, find the runs that own no state
    3. insert one initial state per such run
    4. point each of those runs at its new state
    5. return those runs

  A run that already had a state before the call is never touched. A run
  left without a state by an earlier failed attempt is picked up again
  in step 2, because regenerated candidates carry the same id.

  Storage errors surface as util exceptions (see ThrowIfDbError).
*/
class RunMaterializer {
 public:
  RunMaterializer(std::shared_ptr<db::Repository> repository, db::StateLinkStrategy strategy);

  std::vector<db::model::FlowRunRecord> Materialize(db::Transaction& tx, const std::vector<CandidateRun>& candidates) const;

  db::StateLinkStrategy Strategy() const {
    return strategy_;
  }

 private:
  std::shared_ptr<db::Repository> repository_;
  db::StateLinkStrategy           strategy_;
};

} // namespace flowsched::scheduler
