#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace flowsched::db::memory {

class MemoryTransaction;

/*
  In-process backend.

  Mirrors the SQL schema constraints: unique deployment names,
  (flow_id, idempotency_key) uniqueness on flow runs, schedule and state
  rows cascading with their parents. Both link strategies are evaluated
  the way their SQL statements are.

  Transactions are exclusive: Begin() blocks while another transaction
  on the same repository is open, so do not nest them on one thread.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;
  std::string_view Dialect() const override { return "memory"; }

  Result InsertDeployment(Transaction&, const model::DeploymentRecord&) override;
  std::optional<model::DeploymentRecord> GetDeployment(Transaction&, const std::string&) override;
  std::vector<model::DeploymentRecord> ListDeployments(Transaction&, uint64_t offset,
                                                       std::optional<uint64_t> limit) override;
  Result DeleteDeployment(Transaction&, const std::string&) override;

  Result InsertSchedule(Transaction&, const model::ScheduleRecord&) override;
  std::vector<model::ScheduleRecord> ListSchedules(Transaction&, const std::string& deployment_id) override;
  Result DeleteSchedule(Transaction&, const std::string&) override;

  Result InsertFlowRunsIgnoreConflicts(Transaction&, const std::vector<model::FlowRunRecord>&) override;
  Result ListStatelessFlowRunIds(Transaction&, const std::vector<std::string>& ids,
                                 std::vector<std::string>& out) override;
  Result InsertFlowRunStates(Transaction&, const std::vector<model::FlowRunStateRecord>&) override;
  Result LinkFlowRunStates(Transaction&, StateLinkStrategy strategy,
                           const std::vector<std::string>& state_ids) override;
  std::optional<model::FlowRunRecord> GetFlowRun(Transaction&, const std::string&) override;
  std::vector<model::FlowRunRecord> ListFlowRuns(Transaction&, const std::string& deployment_id) override;
  std::vector<model::FlowRunStateRecord> ListFlowRunStates(Transaction&, const std::string& flow_run_id) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, model::DeploymentRecord> deployments;
    std::set<std::string> deployment_names;

    std::map<std::string, model::ScheduleRecord> schedules;

    std::map<std::string, model::FlowRunRecord> flow_runs;
    std::set<std::pair<std::string, std::string>> run_keys; // (flow_id, idempotency_key)

    std::map<std::string, model::FlowRunStateRecord> states;
    std::map<std::string, std::vector<std::string>> states_by_run;
  };

  std::mutex writer_mutex_;
  State committed_;
};

}
