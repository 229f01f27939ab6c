#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace flowsched::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;
  std::string_view Dialect() const override { return "sqlite"; }

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

  // UPDATE ... FROM arrived in SQLite 3.33.0.
  static bool SupportsUpdateJoin();

private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
