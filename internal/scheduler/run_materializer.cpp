#include "internal/scheduler/run_materializer.hpp"

#include <string>
#include <unordered_set>

#include "internal/scheduler/db_error.hpp"

namespace flowsched::scheduler {

RunMaterializer::RunMaterializer(std::shared_ptr<db::Repository> repository, db::StateLinkStrategy strategy)
    : repository_(std::move(repository)), strategy_(strategy) {
}

std::vector<db::model::FlowRunRecord> RunMaterializer::Materialize(db::Transaction& tx, const std::vector<CandidateRun>& candidates) const {
  std::vector<db::model::FlowRunRecord> created;
  if (candidates.empty()) {
    return created;
  }

  // ------------------------------------------------------------------
  // 1. insert-or-ignore
  // ------------------------------------------------------------------
  std::vector<db::model::FlowRunRecord> runs;
  std::vector<std::string>              submitted_ids;
  runs.reserve(candidates.size());
  submitted_ids.reserve(candidates.size());
  for (const auto& candidate : candidates) {
    runs.push_back(candidate.run);
    runs.back().state_id.reset();
    submitted_ids.push_back(candidate.run.id);
  }
  ThrowIfDbError(repository_->InsertFlowRunsIgnoreConflicts(tx, runs), "insert flow runs");

  // ------------------------------------------------------------------
  // 2. runs without any state are the new ones
  // ------------------------------------------------------------------
  std::vector<std::string> stateless_ids;
  ThrowIfDbError(repository_->ListStatelessFlowRunIds(tx, submitted_ids, stateless_ids), "find new flow runs");
  if (stateless_ids.empty()) {
    return created;
  }

  const std::unordered_set<std::string> new_ids(stateless_ids.begin(), stateless_ids.end());

  // ------------------------------------------------------------------
  // 3. one initial state per new run
  // ------------------------------------------------------------------
  std::vector<db::model::FlowRunStateRecord> states;
  std::vector<std::string>                   state_ids;
  std::unordered_set<std::string>            seen;
  for (const auto& candidate : candidates) {
    // a duplicate candidate must not yield a second state
    if (!new_ids.contains(candidate.run.id) || !seen.insert(candidate.run.id).second) {
      continue;
    }
    auto state        = candidate.initial_state;
    state.flow_run_id = candidate.run.id;
    state_ids.push_back(state.id);
    states.push_back(std::move(state));

    created.push_back(candidate.run);
    created.back().state_id = state_ids.back();
  }
  ThrowIfDbError(repository_->InsertFlowRunStates(tx, states), "insert initial states");

  // ------------------------------------------------------------------
  // 4. link
  // ------------------------------------------------------------------
  ThrowIfDbError(repository_->LinkFlowRunStates(tx, strategy_, state_ids), "link initial states");

  return created;
}

} // namespace flowsched::scheduler
