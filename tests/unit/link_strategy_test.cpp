#include "internal/scheduler/link_strategy.hpp"

#include <cassert>
#include <iostream>

#include "internal/util/errors.hpp"

namespace {

using flowsched::db::StateLinkStrategy;
using flowsched::scheduler::ResolveLinkStrategy;
namespace cfg = flowsched::runtime::config;

void TestAutoFollowsDialect() {
  assert(ResolveLinkStrategy("postgresql", cfg::STATE_LINK_STRATEGY_AUTO) == StateLinkStrategy::kUpdateJoin);
  assert(ResolveLinkStrategy("memory", cfg::STATE_LINK_STRATEGY_AUTO) == StateLinkStrategy::kUpdateJoin);
  assert(ResolveLinkStrategy("sqlite", cfg::STATE_LINK_STRATEGY_AUTO) == StateLinkStrategy::kCorrelatedSubquery);
}

void TestExplicitStrategyWins() {
  assert(ResolveLinkStrategy("sqlite", cfg::STATE_LINK_STRATEGY_UPDATE_JOIN) == StateLinkStrategy::kUpdateJoin);
  assert(ResolveLinkStrategy("postgresql", cfg::STATE_LINK_STRATEGY_CORRELATED_SUBQUERY) ==
         StateLinkStrategy::kCorrelatedSubquery);
  assert(ResolveLinkStrategy("oracle", cfg::STATE_LINK_STRATEGY_CORRELATED_SUBQUERY) ==
         StateLinkStrategy::kCorrelatedSubquery);
}

void TestUnknownDialectIsAConfigurationError() {
  bool threw = false;
  try {
    (void)ResolveLinkStrategy("oracle", cfg::STATE_LINK_STRATEGY_AUTO);
  } catch (const flowsched::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

void TestNames() {
  assert(flowsched::scheduler::ToString(StateLinkStrategy::kUpdateJoin) == "update-join");
  assert(flowsched::scheduler::ToString(StateLinkStrategy::kCorrelatedSubquery) == "correlated-subquery");
}

} // namespace

int main() {
  TestAutoFollowsDialect();
  TestExplicitStrategyWins();
  TestUnknownDialectIsAConfigurationError();
  TestNames();

  std::cout << "flowsched_unit_link_strategy: pass\n";
  return 0;
}
