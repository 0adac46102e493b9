#include <google/protobuf/util/json_util.h>

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/engine/node_dispatcher.hpp"
#include "internal/factory.hpp"
#include "internal/model/run_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "wfrun/v1.hpp"

using namespace wfrun;

static void Usage() {
  std::cout << "Usage:\n"
            << "  wfrunctl --config <config.yaml> create <workflow.json> [--actor A] [--repository R] [--branch B]\n"
            << "                                        [--commit C] [--author U] [--message M] [--tag k=v]...\n"
            << "  wfrunctl --config <config.yaml> advance <run_id> <node_id> <status> [--info msg]... [--error msg]...\n"
            << "  wfrunctl --config <config.yaml> stop <run_id> [--actor A]\n"
            << "  wfrunctl --config <config.yaml> show <project> <workflow> [number]\n"
            << "  wfrunctl --config <config.yaml> list <project> <workflow> [offset] [limit]\n"
            << "  wfrunctl --config <config.yaml> tags <project> <workflow>\n"
            << "\n"
            << "  status: waiting|building|success|fail|stopped|skipped\n";
}

// Prints nodes as they become ready; the CLI has no executor attached.
class PrintingDispatcher final : public engine::NodeDispatcher {
 public:
  void NodeReady(const model::WorkflowRun& run, const model::NodeRun& node_run) override {
    std::cout << "ready run=" << run.id << " node=" << node_run.node_id << " sub=" << node_run.sub_number << "\n";
  }
};

static std::optional<int64_t> ParseInt(const std::string& value) {
  try {
    size_t     consumed = 0;
    const auto parsed   = std::stoll(value, &consumed);
    if (consumed != value.size()) return std::nullopt;
    return parsed;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("cannot open " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

static std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    return "<unprintable: " + std::string(status.message()) + ">";
  }
  return json;
}

static void PrintRunHeader(const model::WorkflowRun& run) {
  std::cout << "run id=" << run.id << " number=" << run.number << " project=" << run.project_key << " workflow=" << run.workflow_name
            << " status=" << model::ToString(run.status) << (run.stop_requested ? " stop_requested" : "")
            << " started_ms=" << util::ToUnixMillis(run.started_at) << "\n";
}

static void PrintRun(const model::WorkflowRun& run) {
  PrintRunHeader(run);

  for (const auto& [node_id, attempts] : run.node_runs) {
    for (const auto& attempt : attempts) {
      std::cout << "  node=" << node_id << " sub=" << attempt.sub_number << " status=" << model::ToString(attempt.status) << "\n";
    }
  }
  for (const auto& tag : run.tags) {
    std::cout << "  tag " << tag.key << "=" << tag.value << "\n";
  }
  for (const auto& info : run.infos) {
    std::cout << "  info " << ToJson(info) << "\n";
  }
  std::cout << "  workflow " << ToJson(run.workflow) << "\n";
}

static int Create(engine::RunEngine& engine, int argc, char** argv, int index) {
  if (index >= argc) return 1;

  v1::Workflow workflow;
  auto         status = google::protobuf::util::JsonStringToMessage(ReadFile(argv[index]), &workflow);
  if (!status.ok()) {
    std::cerr << "invalid workflow json: " << status.message() << "\n";
    return 1;
  }

  v1::TriggerContext trigger;
  for (int i = index + 1; i < argc; ++i) {
    const std::string flag = argv[i];
    if (i + 1 >= argc) {
      std::cerr << "missing value for " << flag << "\n";
      return 1;
    }
    const std::string value = argv[++i];

    if (flag == "--actor") {
      trigger.set_actor(value);
    } else if (flag == "--repository") {
      trigger.set_repository(value);
    } else if (flag == "--branch") {
      trigger.set_branch(value);
    } else if (flag == "--commit") {
      trigger.set_commit_hash(value);
    } else if (flag == "--author") {
      trigger.set_commit_author(value);
    } else if (flag == "--message") {
      trigger.set_commit_message(value);
    } else if (flag == "--tag") {
      const auto eq = value.find('=');
      if (eq == std::string::npos) {
        std::cerr << "tag must be key=value: " << value << "\n";
        return 1;
      }
      (*trigger.mutable_extra_tags())[value.substr(0, eq)] = value.substr(eq + 1);
    } else {
      std::cerr << "unknown flag: " << flag << "\n";
      return 1;
    }
  }

  PrintRun(engine.CreateRun(workflow, trigger));
  return 0;
}

static int Advance(engine::RunEngine& engine, int argc, char** argv, int index) {
  if (index + 2 >= argc) return 1;

  const auto run_id  = ParseInt(argv[index]);
  const auto node_id = ParseInt(argv[index + 1]);
  const auto status  = model::ParseStatus(argv[index + 2]);
  if (!run_id || !node_id) {
    std::cerr << "run_id and node_id must be integers\n";
    return 1;
  }
  if (!status) {
    std::cerr << "unsupported status: " << argv[index + 2] << "\n";
    return 1;
  }

  std::vector<v1::RunInfo> infos;
  for (int i = index + 3; i < argc; ++i) {
    const std::string flag = argv[i];
    if ((flag != "--info" && flag != "--error") || i + 1 >= argc) {
      std::cerr << "unexpected argument: " << flag << "\n";
      return 1;
    }

    v1::RunInfo info;
    info.set_message(argv[++i]);
    info.set_is_error(flag == "--error");
    infos.push_back(std::move(info));
  }

  PrintRun(engine.AdvanceNode(*run_id, *node_id, *status, infos));
  return 0;
}

static int Stop(engine::RunEngine& engine, int argc, char** argv, int index) {
  if (index >= argc) return 1;

  const auto run_id = ParseInt(argv[index]);
  if (!run_id) {
    std::cerr << "run_id must be an integer\n";
    return 1;
  }

  std::string actor;
  if (index + 2 < argc && std::string(argv[index + 1]) == "--actor") {
    actor = argv[index + 2];
  }

  PrintRun(engine.StopRun(*run_id, actor));
  return 0;
}

static int Show(engine::RunEngine& engine, int argc, char** argv, int index) {
  if (index + 1 >= argc) return 1;

  if (index + 2 < argc) {
    const auto number = ParseInt(argv[index + 2]);
    if (!number) {
      std::cerr << "number must be an integer\n";
      return 1;
    }
    PrintRun(engine.LoadRun(argv[index], argv[index + 1], *number));
  } else {
    PrintRun(engine.LoadLastRun(argv[index], argv[index + 1]));
  }
  return 0;
}

static int List(engine::RunEngine& engine, int argc, char** argv, int index) {
  if (index + 1 >= argc) return 1;

  int64_t offset = 0;
  int64_t limit  = 0;
  if (index + 2 < argc) {
    const auto parsed = ParseInt(argv[index + 2]);
    if (!parsed) return 1;
    offset = *parsed;
  }
  if (index + 3 < argc) {
    const auto parsed = ParseInt(argv[index + 3]);
    if (!parsed) return 1;
    limit = *parsed;
  }

  const auto page = engine.LoadRuns(argv[index], argv[index + 1], offset, limit);
  std::cout << "total=" << page.total << " offset=" << page.offset << " limit=" << page.limit << "\n";
  for (const auto& run : page.runs) {
    PrintRunHeader(run);
  }
  return 0;
}

static int Tags(engine::RunEngine& engine, int argc, char** argv, int index) {
  if (index + 1 >= argc) return 1;

  for (const auto& [key, values] : engine.AggregateTagValues(argv[index], argv[index + 1])) {
    std::cout << key << ":";
    for (const auto& value : values) {
      std::cout << " " << value;
    }
    std::cout << "\n";
  }
  return 0;
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string cmd         = argv[3];
  constexpr int     kArgs       = 4;

  int rc = 1;
  try {
    const auto runtime_config = config::ConfigLoader::LoadFromYaml(config_path);

    observability::InitializeLogging(runtime_config.logging());
    observability::InitializeTracing(runtime_config.observability());
    observability::InitializeMetrics(runtime_config.observability());

    auto runtime = factory::BuildRuntime(runtime_config, std::make_shared<PrintingDispatcher>());
    auto& engine = *runtime.engine;

    if (cmd == "create") {
      rc = Create(engine, argc, argv, kArgs);
    } else if (cmd == "advance") {
      rc = Advance(engine, argc, argv, kArgs);
    } else if (cmd == "stop") {
      rc = Stop(engine, argc, argv, kArgs);
    } else if (cmd == "show") {
      rc = Show(engine, argc, argv, kArgs);
    } else if (cmd == "list") {
      rc = List(engine, argc, argv, kArgs);
    } else if (cmd == "tags") {
      rc = Tags(engine, argc, argv, kArgs);
    } else {
      Usage();
    }
    if (rc == 1) {
      std::cerr << "invalid arguments for " << cmd << "\n";
    }
  } catch (const util::LockConflict& e) {
    std::cerr << "run is busy, retry: " << e.what() << "\n";
    rc = 3;
  } catch (const util::NotFound& e) {
    std::cerr << e.what() << "\n";
    rc = 4;
  } catch (const std::exception& e) {
    WFRUN_LOG_ERROR("wfrunctl failed", {observability::StringField("command", cmd), observability::StringField("error", e.what())});
    std::cerr << e.what() << "\n";
    rc = 2;
  }

  observability::ShutdownLogging();
  observability::ShutdownMetrics();
  observability::ShutdownTracing();
  return rc;
}
