#ifndef CONFIG_H_
#define CONFIG_H_

#include <istream>
#include <string>
#include <filesystem>

#include <gradebox/sandbox.h>

namespace fs = std::filesystem;

struct ServerConfig {
  std::string listen_host = "0.0.0.0";
  int listen_port = 8080;
  fs::path box_root = "/tmp/gradebox_box";
  int parallel = kMaxParallel;
  long max_execution_time_ms = 10000;
  long cpu_time_ms = 0; // 0 = same as max_execution_time_ms
  long memory_limit_mb = 256;
  long max_output_kb = 1024;
  long compile_timeout_ms = 30000;
  int max_processes = 0; // 0 = no RLIMIT_NPROC

  SandboxLimits Limits() const;
};

// INI keys live in the unnamed section; absent keys keep their current value
bool ParseConfig(std::istream&, ServerConfig&);
// a missing file is accepted unless required
bool ParseConfigFile(const fs::path&, ServerConfig&, bool required);
// GRADEBOX_* variables; false if one of them is not a valid number
bool ApplyEnv(ServerConfig&);
bool ValidateConfig(const ServerConfig&);
// kBoxRoot, kMaxParallel
void ApplyGlobals(const ServerConfig&);

#endif  // CONFIG_H_
