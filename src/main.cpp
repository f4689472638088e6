#include <fstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <evalbox/paths.h>
#include <evalbox/logger.h>
#include <evalbox/execution.h>
#include "audit.h"
#include "server_limits.h"
#include "server.h"

namespace {

std::string kHost = "0.0.0.0";
int kPort = 8000;
int kMaxParallel = 4;
int kMaxQueue = 16;
std::string kAuditLog;
ServerLimits kLimits;

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string data_dir = ini[""]["data_dir"] | "";
  if (data_dir.size()) internal::kDataDir = data_dir;
  kHost = ini[""]["host"] | kHost;
  kPort = ini[""]["port"] | kPort;
  kMaxParallel = ini[""]["parallel"] | kMaxParallel;
  kMaxQueue = ini[""]["max_queue"] | kMaxQueue;
  kAuditLog = ini[""]["audit_log"] | kAuditLog;
  kLimits.min_timeout_seconds = ini[""]["min_timeout_seconds"] | kLimits.min_timeout_seconds;
  kLimits.max_timeout_seconds = ini[""]["max_timeout_seconds"] | kLimits.max_timeout_seconds;
  kLimits.default_timeout_seconds = ini[""]["default_timeout_seconds"] | kLimits.default_timeout_seconds;
  kLimits.min_memory_mb = ini[""]["min_memory_mb"] | kLimits.min_memory_mb;
  kLimits.max_memory_mb = ini[""]["max_memory_mb"] | kLimits.max_memory_mb;
  kLimits.default_memory_mb = ini[""]["default_memory_mb"] | kLimits.default_memory_mb;
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "evalboxd");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/evalboxd.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of maximum parallel executions");
  parser.add_argument("--host")
    .help("Address to listen on");
  parser.add_argument("--port")
    .scan<'d', int>()
    .help("Port to listen on");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  InitLogger(verbosity);
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (auto val = parser.present<int>("--parallel")) {
    kMaxParallel = val.value();
  }
  if (auto val = parser.present<std::string>("--host")) {
    kHost = val.value();
  }
  if (auto val = parser.present<int>("--port")) {
    kPort = val.value();
  }
  if (kMaxParallel <= 0 || kMaxQueue < 0) {
    spdlog::error("Invalid parallel={} max_queue={}", kMaxParallel, kMaxQueue);
    exit(1);
  }
  try {
    kLimits.Validate();
  } catch (const std::invalid_argument& err) {
    spdlog::error("{}", err.what());
    exit(1);
  }
}

} // namespace

int main(int argc, char** argv) {
  ParseArgs(argc, argv);
  InitAuditLog(kAuditLog);
  if (!WorkerAvailable()) {
    spdlog::warn("Worker executable {} is not available; executions will fail", WorkerPath().c_str());
  }
  if (!MemoryLimitSupported()) {
    spdlog::warn("Memory limits cannot be enforced on this host");
  }
  EvalServer server(kLimits, kMaxParallel, kMaxQueue);
  if (!server.Listen(kHost, kPort)) {
    spdlog::error("Failed to listen on {}:{}", kHost, kPort);
    return 1;
  }
}
