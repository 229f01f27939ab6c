#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace flowsched::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;
  std::string_view Dialect() const override { return "postgresql"; }

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
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
