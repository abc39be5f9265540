#include <google/protobuf/util/json_util.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/rocket/rocket.hpp"
#include "internal/tasks/task_registry.hpp"
#include "launchpad/v1.hpp"

using namespace launchpad::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  lpad <config.yaml> add <workflow.json>\n"
            << "  lpad <config.yaml> get_fw <fw_id>\n"
            << "  lpad <config.yaml> get_wf <fw_id>\n"
            << "  lpad <config.yaml> get_launch <launch_id>\n"
            << "  lpad <config.yaml> list [state]\n"
            << "  lpad <config.yaml> pause|resume|defuse|reignite|rerun <fw_id>\n"
            << "  lpad <config.yaml> pause_wf|defuse_wf|reignite_wf|archive_wf <fw_id>\n"
            << "  lpad <config.yaml> singleshot [fw_id]\n"
            << "  lpad <config.yaml> rapidfire [max_launches]\n"
            << "  lpad <config.yaml> detect_lostruns [expiration_seconds]\n"
            << "  lpad <config.yaml> reset <YYYY-MM-DD>\n";
}

static int64_t ParseId(const std::string& s) {
  try {
    size_t     pos = 0;
    const auto id  = std::stoll(s, &pos);
    if (pos == s.size()) return id;
  } catch (const std::exception&) {
  }
  std::cerr << "invalid id: '" << s << "'\n";
  std::exit(1);
}

static void PrintJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace             = true;
  options.preserve_proto_field_names = true;
  std::string json;
  const auto  status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("render json: " + std::string(status.message()));
  }
  std::cout << json;
}

static WorkflowSpec LoadWorkflowSpec(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  WorkflowSpec spec;
  const auto   status = google::protobuf::util::JsonStringToMessage(buffer.str(), &spec);
  if (!status.ok()) {
    throw std::runtime_error("invalid workflow " + path + ": " + std::string(status.message()));
  }
  return spec;
}

static std::string HostName() {
  const char* host = std::getenv("HOSTNAME");
  return host ? host : "localhost";
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];
  const auto        arg         = [&](int i) -> std::optional<std::string> {
    if (argc > 2 + i) return std::string(argv[2 + i]);
    return std::nullopt;
  };
  const auto require_id = [&]() {
    auto value = arg(1);
    if (!value) {
      Usage();
      std::exit(1);
    }
    return ParseId(*value);
  };

  try {
    auto config = launchpad::config::ConfigLoader::LoadFromYaml(config_path);
    launchpad::observability::InitializeLogging(config);

    auto  app = launchpad::factory::Build(config);
    auto& lp  = *app.launchpad;

    launchpad::tasks::TaskRegistry registry;
    launchpad::tasks::RegisterBuiltinTasks(registry);
    const launchpad::checkout::WorkerInfo worker{"lpad", HostName(), ""};

    if (cmd == "add") {
      auto path = arg(1);
      if (!path) {
        Usage();
        return 1;
      }
      const auto result = lp.SubmitWorkflow(LoadWorkflowSpec(*path));
      std::cout << "wf_id=" << result.wf_id << "\n";
      for (const auto& [provisional, assigned] : result.id_map) {
        std::cout << "  " << provisional << " -> " << assigned << "\n";
      }
    } else if (cmd == "get_fw") {
      PrintJson(lp.GetFirework(require_id()));
    } else if (cmd == "get_wf") {
      PrintJson(lp.GetWorkflowByFireworkId(require_id()));
    } else if (cmd == "get_launch") {
      PrintJson(lp.GetLaunch(require_id()));
    } else if (cmd == "list") {
      std::optional<FireworkState> state;
      if (auto name = arg(1)) state = launchpad::model::StateFromString(*name);
      for (const auto id : lp.GetFireworkIds(state)) std::cout << id << "\n";
    } else if (cmd == "pause") {
      PrintJson(lp.PauseFirework(require_id()));
    } else if (cmd == "resume") {
      PrintJson(lp.ResumeFirework(require_id()));
    } else if (cmd == "defuse") {
      PrintJson(lp.DefuseFirework(require_id()));
    } else if (cmd == "reignite") {
      PrintJson(lp.ReigniteFirework(require_id()));
    } else if (cmd == "rerun") {
      PrintJson(lp.RerunFirework(require_id()));
    } else if (cmd == "pause_wf") {
      PrintJson(lp.PauseWorkflow(require_id()));
    } else if (cmd == "defuse_wf") {
      PrintJson(lp.DefuseWorkflow(require_id()));
    } else if (cmd == "reignite_wf") {
      PrintJson(lp.ReigniteWorkflow(require_id()));
    } else if (cmd == "archive_wf") {
      PrintJson(lp.ArchiveWorkflow(require_id()));
    } else if (cmd == "singleshot") {
      std::optional<int64_t> target;
      if (auto id = arg(1)) target = ParseId(*id);
      const bool launched = launchpad::rocket::LaunchRocket(lp, registry, worker, target);
      std::cout << (launched ? "launched\n" : "no READY fireworks\n");
    } else if (cmd == "rapidfire") {
      uint64_t max_launches = 0;
      if (auto n = arg(1)) max_launches = static_cast<uint64_t>(ParseId(*n));
      std::cout << "launches=" << launchpad::rocket::RapidFire(lp, registry, worker, max_launches) << "\n";
    } else if (cmd == "detect_lostruns") {
      std::optional<std::chrono::milliseconds> expiration;
      if (auto seconds = arg(1)) expiration = std::chrono::seconds(ParseId(*seconds));
      for (const auto id : lp.DetectLostRuns(expiration)) std::cout << id << "\n";
    } else if (cmd == "reset") {
      auto password = arg(1);
      if (!password) {
        Usage();
        return 1;
      }
      lp.ResetStore(*password);
      std::cout << "store reset\n";
    } else {
      Usage();
      return 1;
    }
  } catch (const std::exception& e) {
    std::cerr << "lpad " << cmd << " failed: " << e.what() << "\n";
    launchpad::observability::ShutdownLogging();
    return 2;
  }

  launchpad::observability::ShutdownLogging();
  return 0;
}
