#include <fstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <argparse/argparse.hpp>
#include <gradebox/json.h>
#include <gradebox/grader.h>
#include <gradebox/logger.h>
#include <gradebox/prober.h>
#include <gradebox/paths.h>
#include "database.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitInfra = 1;
constexpr int kExitInvalid = 2;
constexpr int kExitReferenceFailed = 3;

struct Command {
  std::string name;
  std::string task_file;
  std::string request_file; // empty for stdin
  long task_id;
  size_t limit;
};

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string workspace_root = ini[""]["workspace_root"] | "";
  std::string database = ini[""]["database"] | "";
  if (workspace_root.size()) kWorkspaceRoot = workspace_root;
  if (database.size()) kDatabasePath = database;
  kGoBinary = ini[""]["go_binary"] | kGoBinary;
  kSolcBinary = ini[""]["solc_binary"] | kSolcBinary;
  kDefaultTimeoutMs = (ini[""]["timeout_sec"] | (kDefaultTimeoutMs / 1000)) * 1000;
  kProbeTimeoutMs = (ini[""]["probe_timeout_sec"] | (kProbeTimeoutMs / 1000)) * 1000;
  kMaxOutputBytes = (ini[""]["max_output_kib"] | (kMaxOutputBytes / 1024)) * 1024;
  return true;
}

Command ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "gradebox");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("--timeout")
    .scan<'d', long>()
    .help("Timeout of each compile or test run in seconds");
  parser.add_argument("--workspace-root")
    .help("Directory under which workspaces are created");
  parser.add_argument("--database")
    .help("Path of the submission database");
  parser.add_argument("command")
    .help("One of submit, check, probe, history, stats");
  parser.add_argument("--task")
    .default_value(std::string(""))
    .help("Task definition (JSON) for submit and check");
  parser.add_argument("--request")
    .default_value(std::string(""))
    .help("Submission request (JSON); read from stdin if omitted");
  parser.add_argument("--task-id")
    .scan<'d', long>()
    .default_value(0L)
    .help("Task id for history and stats");
  parser.add_argument("--limit")
    .scan<'d', int>()
    .default_value(20)
    .help("Number of records for history; 0 for all");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(kExitInvalid);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  // the default file is optional; a named one must exist
  if (auto config_file = parser.present("--config")) {
    if (!ParseConfig(*config_file)) {
      spdlog::error("Failed to parse configuration file {}", *config_file);
      exit(kExitInfra);
    }
  } else if (!ParseConfig(kConfigPath)) {
    spdlog::info("No configuration file at {}, using defaults", kConfigPath.c_str());
  }
  if (auto val = parser.present<long>("--timeout")) {
    kDefaultTimeoutMs = val.value() * 1000;
  }
  if (auto val = parser.present("--workspace-root")) kWorkspaceRoot = *val;
  if (auto val = parser.present("--database")) kDatabasePath = *val;

  Command ret;
  ret.name = parser.get<std::string>("command");
  ret.task_file = parser.get<std::string>("--task");
  ret.request_file = parser.get<std::string>("--request");
  ret.task_id = parser.get<long>("--task-id");
  int limit = parser.get<int>("--limit");
  ret.limit = limit > 0 ? limit : 0;
  return ret;
}

bool ReadJSON(const std::string& path, nlohmann::json& data) {
  try {
    if (path.empty()) {
      std::cin >> data;
    } else {
      std::ifstream fin(path);
      if (!fin) {
        spdlog::error("Cannot open {}", path);
        return false;
      }
      fin >> data;
    }
  } catch (nlohmann::json::exception& err) {
    spdlog::error("Invalid JSON in {}: {}", path.empty() ? "stdin" : path, err.what());
    return false;
  }
  return true;
}

bool LoadTask(const std::string& path, Task& task) {
  if (path.empty()) {
    spdlog::error("--task is required");
    return false;
  }
  nlohmann::json data;
  if (!ReadJSON(path, data)) return false;
  std::string message;
  if (!ParseTask(data, task, message)) {
    spdlog::error("Invalid task {}: {}", path, message);
    return false;
  }
  return true;
}

void Print(const nlohmann::json& data) {
  std::cout << data.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

int Submit(Grader& grader, const Command& cmd) {
  Task task;
  if (!LoadTask(cmd.task_file, task)) return kExitInvalid;
  nlohmann::json data;
  if (!ReadJSON(cmd.request_file, data)) return kExitInvalid;
  SubmissionRequest req;
  std::string message;
  if (!ParseRequest(data, req, message)) {
    spdlog::error("Invalid request: {}", message);
    return kExitInvalid;
  }
  GradeResponse res = grader.Submit(task, req);
  Print(ResponseJSON(res));
  switch (res.error) {
    case ResponseError::NONE: return kExitOk;
    case ResponseError::VALIDATION: return kExitInvalid;
    default: return kExitInfra;
  }
}

int Check(Grader& grader, const Command& cmd) {
  Task task;
  if (!LoadTask(cmd.task_file, task)) return kExitInvalid;
  Outcome outcome = grader.CheckReference(task);
  Print(OutcomeJSON(outcome));
  if (outcome.IsInfrastructureFailure()) return kExitInfra;
  return outcome.Passed() ? kExitOk : kExitReferenceFailed;
}

int Probe(const DriverRegistry& drivers) {
  nlohmann::json data = nlohmann::json::array();
  bool all_available = true;
  for (auto& i : ProbeToolchains(drivers, kProbeTimeoutMs)) {
    all_available &= i.available;
    data.push_back(ToolchainJSON(i));
  }
  Print(data);
  return all_available ? kExitOk : kExitInfra;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  Command cmd = ParseArgs(argc, argv);

  PosixProcessRunner runner;
  DriverRegistry drivers = DefaultDrivers(runner);
  if (cmd.name == "probe") return Probe(drivers);

  Database db(kDatabasePath);
  Grader grader(drivers, db, kWorkspaceRoot, kDefaultTimeoutMs);
  try {
    if (cmd.name == "submit") return Submit(grader, cmd);
    if (cmd.name == "check") return Check(grader, cmd);
    if (cmd.name == "history") {
      nlohmann::json data = nlohmann::json::array();
      for (auto& i : grader.TaskHistory(cmd.task_id, cmd.limit)) data.push_back(SubmissionJSON(i));
      Print(data);
      return kExitOk;
    }
    if (cmd.name == "stats") {
      Print(StatsJSON(grader.ComputeTaskStats(cmd.task_id)));
      return kExitOk;
    }
  } catch (std::exception& err) {
    spdlog::error("{} failed: {}", cmd.name, err.what());
    return kExitInfra;
  }
  spdlog::error("Unknown command {}", cmd.name);
  return kExitInvalid;
}
