#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/deployment_record.hpp"
#include "internal/db/model/flow_run_record.hpp"
#include "internal/db/model/flow_run_state_record.hpp"
#include "internal/db/model/schedule_record.hpp"

namespace flowsched::db {

/*
  Ways of pointing flow_run.state_id at a freshly inserted state row.

  kUpdateJoin:
    UPDATE flow_run SET state_id = s.id FROM flow_run_state s
     WHERE s.flow_run_id = flow_run.id AND s.id IN (...)

  kCorrelatedSubquery:
    UPDATE flow_run SET state_id = (SELECT s.id FROM flow_run_state s
                                     WHERE s.flow_run_id = flow_run.id
                                       AND s.id IN (...) LIMIT 1)
     WHERE id IN (SELECT flow_run_id FROM flow_run_state WHERE id IN (...))

  Both touch exactly the runs that own one of the given states.
*/
enum class StateLinkStrategy {
  kUpdateJoin,
  kCorrelatedSubquery,
};

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes require a Transaction
  - Reads inside a transaction see its writes
  - (flow_id, idempotency_key) is unique across flow_run
  - InsertFlowRunsIgnoreConflicts never fails because of that constraint

  The DB is the source of truth for:
    deployments and their schedules
    flow runs and their states
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // Backend identifier: "sqlite", "postgresql", "memory".
  virtual std::string_view Dialect() const = 0;

  // ---------------------------------------------------------------------
  // Deployments
  // ---------------------------------------------------------------------

  virtual Result InsertDeployment(Transaction&, const model::DeploymentRecord&) = 0;

  virtual std::optional<model::DeploymentRecord> GetDeployment(Transaction&, const std::string& id) = 0;

  // Ordered by id.
  virtual std::vector<model::DeploymentRecord> ListDeployments(Transaction&, uint64_t offset, std::optional<uint64_t> limit) = 0;

  // NotFound when nothing was deleted. Schedules cascade.
  virtual Result DeleteDeployment(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Schedules
  // ---------------------------------------------------------------------

  virtual Result InsertSchedule(Transaction&, const model::ScheduleRecord&) = 0;

  // Ordered by creation time, then id.
  virtual std::vector<model::ScheduleRecord> ListSchedules(Transaction&, const std::string& deployment_id) = 0;

  virtual Result DeleteSchedule(Transaction&, const std::string& id) = 0;

  // ---------------------------------------------------------------------
  // Flow runs
  // ---------------------------------------------------------------------

  // Insert-or-ignore keyed on (flow_id, idempotency_key).
  virtual Result InsertFlowRunsIgnoreConflicts(Transaction&, const std::vector<model::FlowRunRecord>& runs) = 0;

  // Subset of `ids` that exist in flow_run and own no flow_run_state row.
  virtual Result ListStatelessFlowRunIds(Transaction&, const std::vector<std::string>& ids, std::vector<std::string>& out) = 0;

  virtual Result InsertFlowRunStates(Transaction&, const std::vector<model::FlowRunStateRecord>& states) = 0;

  // Unsupported when the backend cannot execute `strategy`.
  virtual Result LinkFlowRunStates(Transaction&, StateLinkStrategy strategy, const std::vector<std::string>& state_ids) = 0;

  virtual std::optional<model::FlowRunRecord> GetFlowRun(Transaction&, const std::string& id) = 0;

  // Ordered by creation time, then id.
  virtual std::vector<model::FlowRunRecord> ListFlowRuns(Transaction&, const std::string& deployment_id) = 0;

  // Ordered by creation time, then id.
  virtual std::vector<model::FlowRunStateRecord> ListFlowRunStates(Transaction&, const std::string& flow_run_id) = 0;
};

} // namespace flowsched::db
