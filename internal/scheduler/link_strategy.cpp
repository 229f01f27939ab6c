#include "internal/scheduler/link_strategy.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace flowsched::scheduler {

using flowsched::runtime::config::StateLinkStrategy;

db::StateLinkStrategy ResolveLinkStrategy(std::string_view dialect, StateLinkStrategy configured) {
  switch (configured) {
    case flowsched::runtime::config::STATE_LINK_STRATEGY_UPDATE_JOIN:
      return db::StateLinkStrategy::kUpdateJoin;
    case flowsched::runtime::config::STATE_LINK_STRATEGY_CORRELATED_SUBQUERY:
      return db::StateLinkStrategy::kCorrelatedSubquery;
    default:
      break;
  }

  if (dialect == "postgresql" || dialect == "memory") {
    return db::StateLinkStrategy::kUpdateJoin;
  }
  if (dialect == "sqlite") {
    return db::StateLinkStrategy::kCorrelatedSubquery;
  }
  throw util::ConfigurationError("no state link strategy for database dialect '" + std::string(dialect) + "'");
}

std::string_view ToString(db::StateLinkStrategy strategy) {
  switch (strategy) {
    case db::StateLinkStrategy::kUpdateJoin:
      return "update-join";
    case db::StateLinkStrategy::kCorrelatedSubquery:
      return "correlated-subquery";
  }
  return "unknown";
}

} // namespace flowsched::scheduler
