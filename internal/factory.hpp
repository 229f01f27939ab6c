#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/scheduler/run_materializer.hpp"
#include "internal/scheduler/schedule_worker.hpp"
#include "internal/scheduler/scheduler_service.hpp"

namespace flowsched::factory {

/*
  Application

  Owns all long-lived objects used by the daemon and the CLI.
  Everything here lives for the lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<scheduler::RunMaterializer>  materializer;
  std::shared_ptr<scheduler::SchedulerService> scheduler;

  // Null when scheduler.enabled is false. Not started.
  std::shared_ptr<scheduler::ScheduleWorker> worker;
};

/*
  Build

  Constructs the entire backend based on runtime config. The state link
  strategy is resolved here, once.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const flowsched::runtime::config::RuntimeConfig& config);

// Opens the configured backend and creates its schema if missing.
// No database section selects the in-memory backend.
std::shared_ptr<db::Repository> BuildRepository(const flowsched::runtime::config::RuntimeConfig& config);

scheduler::SweepOptions SweepOptionsFromConfig(const flowsched::runtime::config::SchedulerConfig& config);

} // namespace flowsched::factory
