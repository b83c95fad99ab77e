#include "config.h"

#include <cstdlib>
#include <cstring>
#include <fstream>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <gradebox/paths.h>

namespace {

bool ReadEnv(const char* name, std::string& val) {
  const char* env = getenv(name);
  if (!env) return true;
  val = env;
  return true;
}

template <class T>
bool ReadEnv(const char* name, T& val) {
  const char* env = getenv(name);
  if (!env) return true;
  try {
    size_t pos;
    long parsed = std::stol(env, &pos);
    if (pos != strlen(env)) throw std::invalid_argument(name);
    val = parsed;
  } catch (const std::exception&) {
    spdlog::error("Invalid value of {}: {}", name, env);
    return false;
  }
  return true;
}

} // namespace

SandboxLimits ServerConfig::Limits() const {
  SandboxLimits ret;
  ret.wall_time = max_execution_time_ms * 1000;
  ret.cpu_time = (cpu_time_ms ? cpu_time_ms : max_execution_time_ms) * 1000;
  ret.memory = memory_limit_mb * 1024;
  ret.output = max_output_kb;
  ret.proc_num = max_processes;
  ret.compile_wall_time = compile_timeout_ms * 1000;
  return ret;
}

bool ParseConfig(std::istream& fin, ServerConfig& cfg) {
  tortellini::ini ini;
  fin >> ini;
  cfg.listen_host = ini[""]["listen_host"] | cfg.listen_host;
  cfg.listen_port = ini[""]["listen_port"] | cfg.listen_port;
  std::string box_root = ini[""]["box_root"] | "";
  if (box_root.size()) cfg.box_root = box_root;
  cfg.parallel = ini[""]["parallel"] | cfg.parallel;
  cfg.max_execution_time_ms = ini[""]["max_execution_time_ms"] | cfg.max_execution_time_ms;
  cfg.cpu_time_ms = ini[""]["cpu_time_ms"] | cfg.cpu_time_ms;
  cfg.memory_limit_mb = ini[""]["memory_limit_mb"] | cfg.memory_limit_mb;
  cfg.max_output_kb = ini[""]["max_output_kb"] | cfg.max_output_kb;
  cfg.compile_timeout_ms = ini[""]["compile_timeout_ms"] | cfg.compile_timeout_ms;
  cfg.max_processes = ini[""]["max_processes"] | cfg.max_processes;
  return true;
}

bool ParseConfigFile(const fs::path& conf_path, ServerConfig& cfg, bool required) {
  std::ifstream fin(conf_path);
  if (!fin) {
    if (required) return false;
    spdlog::info("Configuration file {} not found, using defaults", conf_path.c_str());
    return true;
  }
  return ParseConfig(fin, cfg);
}

bool ApplyEnv(ServerConfig& cfg) {
  std::string box_root;
  bool ok = ReadEnv("GRADEBOX_LISTEN_HOST", cfg.listen_host) &&
      ReadEnv("GRADEBOX_LISTEN_PORT", cfg.listen_port) &&
      ReadEnv("GRADEBOX_BOX_ROOT", box_root) &&
      ReadEnv("GRADEBOX_PARALLEL", cfg.parallel) &&
      ReadEnv("GRADEBOX_MAX_EXECUTION_TIME_MS", cfg.max_execution_time_ms) &&
      ReadEnv("GRADEBOX_CPU_TIME_MS", cfg.cpu_time_ms) &&
      ReadEnv("GRADEBOX_MEMORY_LIMIT_MB", cfg.memory_limit_mb) &&
      ReadEnv("GRADEBOX_MAX_OUTPUT_KB", cfg.max_output_kb) &&
      ReadEnv("GRADEBOX_COMPILE_TIMEOUT_MS", cfg.compile_timeout_ms) &&
      ReadEnv("GRADEBOX_MAX_PROCESSES", cfg.max_processes);
  if (box_root.size()) cfg.box_root = box_root;
  return ok;
}

bool ValidateConfig(const ServerConfig& cfg) {
  auto Check = [](bool cond, const char* key, long val) {
    if (!cond) spdlog::error("Invalid configuration {}={}", key, val);
    return cond;
  };
  return Check(cfg.listen_port > 0 && cfg.listen_port < 65536, "listen_port", cfg.listen_port) &&
      Check(cfg.parallel > 0, "parallel", cfg.parallel) &&
      Check(cfg.max_execution_time_ms > 0, "max_execution_time_ms", cfg.max_execution_time_ms) &&
      Check(cfg.cpu_time_ms >= 0, "cpu_time_ms", cfg.cpu_time_ms) &&
      Check(cfg.memory_limit_mb > 0, "memory_limit_mb", cfg.memory_limit_mb) &&
      Check(cfg.max_output_kb > 0, "max_output_kb", cfg.max_output_kb) &&
      Check(cfg.compile_timeout_ms > 0, "compile_timeout_ms", cfg.compile_timeout_ms) &&
      Check(cfg.max_processes >= 0, "max_processes", cfg.max_processes) &&
      Check(!cfg.box_root.empty() && cfg.box_root.is_absolute(), "box_root (absolute path)", 0);
}

void ApplyGlobals(const ServerConfig& cfg) {
  kBoxRoot = cfg.box_root;
  kMaxParallel = cfg.parallel;
}
