#include <fcntl.h>
#include <unistd.h>
#include <iostream>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <gradebox/logger.h>
#include <gradebox/paths.h>
#include "gradebox/utils.h"
#include "config.h"
#include "server_io.h"

namespace {

bool to_lock = true;

bool ParseArgs(int argc, char** argv, ServerConfig& cfg) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "gradebox-server");
  parser.add_argument("-c", "--config")
    .help("Path of configuration file (default /etc/gradebox.conf)");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("--host")
    .help("Listen address");
  parser.add_argument("--port")
    .scan<'d', int>()
    .help("Listen port");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of maximum parallel executions");
  parser.add_argument("-t", "--time-limit")
    .scan<'d', long>()
    .help("Wall-clock limit of each execution in milliseconds");
  parser.add_argument("-m", "--memory-limit")
    .scan<'d', long>()
    .help("Memory limit of each execution in MiB");
  parser.add_argument("--no-lock")
    .default_value(false)
    .implicit_value(true)
    .help("Not check for other running instances");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    return false;
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  auto config_file = parser.present<std::string>("--config");
  fs::path config_path = config_file ? *config_file : "/etc/gradebox.conf";
  if (!ParseConfigFile(config_path, cfg, config_file.has_value())) {
    spdlog::error("Failed to parse configuration file {}", config_path.c_str());
    return false;
  }
  if (!ApplyEnv(cfg)) return false;
  if (auto val = parser.present<std::string>("--host")) cfg.listen_host = val.value();
  if (auto val = parser.present<int>("--port")) cfg.listen_port = val.value();
  if (auto val = parser.present<int>("--parallel")) cfg.parallel = val.value();
  if (auto val = parser.present<long>("--time-limit")) cfg.max_execution_time_ms = val.value();
  if (auto val = parser.present<long>("--memory-limit")) cfg.memory_limit_mb = val.value();
  to_lock = parser["--no-lock"] == false;
  return ValidateConfig(cfg);
}

bool LockFile() {
  fs::path lock_file = kBoxRoot / "lock";
  int fd = open(lock_file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) return false;
  struct flock lock{};
  lock.l_type = F_WRLCK;
  lock.l_whence = SEEK_SET;
  lock.l_start = lock.l_len = 0;
  if (fcntl(fd, F_SETLK, &lock) < 0) return false;
  return true;
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  ServerConfig cfg;
  if (!ParseArgs(argc, argv, cfg)) return 1;
  ApplyGlobals(cfg);
  if (!CreateDirs(kBoxRoot)) {
    spdlog::error("Cannot create box root {}", kBoxRoot.c_str());
    return 1;
  }
  if (to_lock && !LockFile()) {
    spdlog::error("Another instance is using {}", kBoxRoot.c_str());
    return 1;
  }
  spdlog::info("Starting with parallel={} time={}ms memory={}MiB output={}KiB",
               kMaxParallel, cfg.max_execution_time_ms, cfg.memory_limit_mb, cfg.max_output_kb);
  return ServerWorkLoop(cfg) ? 0 : 1;
}
