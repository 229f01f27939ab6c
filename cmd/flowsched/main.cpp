#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/metrics.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: flowsched <config.yaml> OR flowsched --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = flowsched::config::ConfigLoader::LoadFromYaml(config_path);

    flowsched::observability::InitializeMetrics(config);
    flowsched::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = flowsched::factory::Build(config);

    if (!app.worker) {
      // scheduler disabled: a single sweep, then exit
      FLOWSCHED_LOG_INFO("Periodic scheduling disabled, running one sweep");
      auto result = app.scheduler->ScheduleAllDeployments(flowsched::factory::SweepOptionsFromConfig(config.scheduler()));
      flowsched::observability::ShutdownLogging();
      flowsched::observability::ShutdownMetrics();
      return result.failures == 0 ? 0 : 3;
    }

    // Register signal handlers before starting the worker to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.worker->Start();
    FLOWSCHED_LOG_INFO("flowsched started", {flowsched::observability::StringField("config", config_path)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FLOWSCHED_LOG_INFO("Shutting down flowsched");

    app.worker->Stop();
    flowsched::observability::ShutdownLogging();
    flowsched::observability::ShutdownMetrics();
  } catch (const std::exception& e) {
    FLOWSCHED_LOG_ERROR("Fatal error", {flowsched::observability::StringField("error", e.what())});
    flowsched::observability::ShutdownLogging();
    flowsched::observability::ShutdownMetrics();
    return 2;
  }

  return 0;
}
