#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/scheduler/db_error.hpp"
#include "internal/util/parse.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

using flowsched::scheduler::ThrowIfDbError;

static void Usage() {
  std::cout << "Usage:\n"
            << "  flowschedctl <config.yaml> deployment create <name> <flow_id>\n"
            << "  flowschedctl <config.yaml> deployment list [offset] [limit]\n"
            << "  flowschedctl <config.yaml> deployment delete <id>\n"
            << "  flowschedctl <config.yaml> schedule add <deployment_id> <interval_seconds> [anchor_rfc3339] [parameters_json]\n"
            << "  flowschedctl <config.yaml> schedule list <deployment_id>\n"
            << "  flowschedctl <config.yaml> schedule-runs <deployment_id> [max_runs]\n"
            << "  flowschedctl <config.yaml> runs <deployment_id>\n";
}

static bool IsJsonObject(const std::string& text) {
  google::protobuf::Struct parsed;
  return google::protobuf::util::JsonStringToMessage(text, &parsed).ok();
}

// Unsigned decimal argument; prints the error itself.
static std::optional<uint64_t> ParseCount(const char* text, const char* what) {
  auto value = flowsched::util::ParseUnsigned(text);
  if (!value.has_value()) {
    std::cerr << what << " must be a non-negative integer: " << text << "\n";
  }
  return value;
}

static void PrintRun(const flowsched::db::model::FlowRunRecord& run) {
  std::cout << run.id << " key=\"" << run.idempotency_key << "\" schedule=" << run.schedule_id
            << " state=" << run.state_id.value_or("-") << "\n";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];
  const std::string sub         = argc >= 4 ? argv[3] : "";

  try {
    auto config = flowsched::config::ConfigLoader::LoadFromYaml(config_path);
    flowsched::observability::InitializeLogging(config);

    auto  app  = flowsched::factory::Build(config);
    auto& repo = *app.repository;

    // ------------------------------------------------------------

    if (cmd == "deployment" && sub == "create") {
      if (argc < 6) {
        Usage();
        return 1;
      }

      flowsched::db::model::DeploymentRecord record;
      record.id            = flowsched::util::NewId();
      record.name          = argv[4];
      record.flow_id       = argv[5];
      record.created_at_ms = flowsched::util::ToUnixMillis(flowsched::util::Now());

      auto tx = repo.Begin();
      ThrowIfDbError(repo.InsertDeployment(*tx, record), "create deployment");
      tx->Commit();

      std::cout << record.id << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "deployment" && sub == "list") {
      uint64_t                offset = 0;
      std::optional<uint64_t> limit;
      if (argc >= 5) {
        auto parsed = ParseCount(argv[4], "offset");
        if (!parsed.has_value()) return 1;
        offset = *parsed;
      }
      if (argc >= 6) {
        limit = ParseCount(argv[5], "limit");
        if (!limit.has_value()) return 1;
      }

      auto tx = repo.Begin();
      for (const auto& d : repo.ListDeployments(*tx, offset, limit)) {
        std::cout << d.id << " name=" << d.name << " flow=" << d.flow_id << "\n";
      }
      tx->Commit();
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "deployment" && sub == "delete") {
      if (argc < 5) {
        Usage();
        return 1;
      }

      auto tx = repo.Begin();
      ThrowIfDbError(repo.DeleteDeployment(*tx, argv[4]), "delete deployment");
      tx->Commit();

      std::cout << "deleted\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "schedule" && sub == "add") {
      if (argc < 6) {
        Usage();
        return 1;
      }

      auto interval = ParseCount(argv[5], "interval_seconds");
      if (!interval.has_value()) return 1;

      flowsched::db::model::ScheduleRecord record;
      record.id               = flowsched::util::NewId();
      record.deployment_id    = argv[4];
      record.interval_seconds = *interval;
      record.created_at_ms    = flowsched::util::ToUnixMillis(flowsched::util::Now());
      record.anchor_ms        = static_cast<int64_t>(record.created_at_ms);

      if (argc >= 7) {
        auto anchor = flowsched::util::ParseRfc3339(argv[6]);
        if (!anchor.has_value()) {
          std::cerr << "invalid anchor time: " << argv[6] << "\n";
          return 1;
        }
        record.anchor_ms = anchor->time_since_epoch().count();
      }
      if (argc >= 8) {
        if (!IsJsonObject(argv[7])) {
          std::cerr << "parameters must be a JSON object: " << argv[7] << "\n";
          return 1;
        }
        record.parameters = argv[7];
      }
      if (record.interval_seconds == 0) {
        std::cerr << "interval_seconds must be positive\n";
        return 1;
      }

      auto tx = repo.Begin();
      ThrowIfDbError(repo.InsertSchedule(*tx, record), "add schedule");
      tx->Commit();

      std::cout << record.id << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "schedule" && sub == "list") {
      if (argc < 5) {
        Usage();
        return 1;
      }

      auto tx = repo.Begin();
      for (const auto& s : repo.ListSchedules(*tx, argv[4])) {
        std::cout << s.id << " every=" << s.interval_seconds << "s anchor="
                  << flowsched::util::FormatRfc3339(flowsched::util::FromUnixMillis(s.anchor_ms)) << " parameters=" << s.parameters
                  << "\n";
      }
      tx->Commit();
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "schedule-runs") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      std::optional<std::size_t> max_runs;
      if (argc >= 5) {
        auto parsed = ParseCount(argv[4], "max_runs");
        if (!parsed.has_value()) return 1;
        max_runs = static_cast<std::size_t>(*parsed);
      }

      auto created = app.scheduler->ScheduleRuns(argv[3], std::nullopt, std::nullopt, max_runs);
      for (const auto& run : created) PrintRun(run);
      std::cout << "created=" << created.size() << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "runs") {
      if (argc < 4) {
        Usage();
        return 1;
      }

      auto tx = repo.Begin();
      for (const auto& run : repo.ListFlowRuns(*tx, argv[3])) PrintRun(run);
      tx->Commit();
      return 0;
    }
  } catch (const std::exception& e) {
    FLOWSCHED_LOG_ERROR("flowschedctl failed", {flowsched::observability::StringField("command", cmd),
                                                 flowsched::observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    return 2;
  }

  Usage();
  return 1;
}
