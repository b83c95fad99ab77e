#include "utils.h"

#include <unistd.h>
#include <cstdlib>
#include <map>
#include <sstream>
#include <vector>

namespace {

bool InPath(const std::string& prog) {
  const char* path = getenv("PATH");
  if (!path) return false;
  std::istringstream dirs(path);
  for (std::string dir; std::getline(dirs, dir, ':');) {
    if (dir.empty()) continue;
    if (access((dir + "/" + prog).c_str(), X_OK) == 0) return true;
  }
  return false;
}

} // namespace

bool ToolchainAvailable(const std::string& language_id) {
  static const std::map<std::string, std::vector<std::string>> kPrograms = {
    {"python", {"python3"}},
    {"javascript", {"node"}},
    {"java", {"javac", "java"}},
    {"cpp", {"g++"}},
    {"c", {"gcc"}},
    {"go", {"go"}},
  };
  auto it = kPrograms.find(language_id);
  if (it == kPrograms.end()) return false;
  for (auto& prog : it->second) {
    if (!InPath(prog)) return false;
  }
  return true;
}

SandboxLimits TestLimits(long wall_ms, long memory_mib) {
  SandboxLimits ret;
  ret.wall_time = wall_ms * 1000;
  ret.cpu_time = wall_ms * 1000;
  ret.memory = memory_mib * 1024;
  ret.compile_wall_time = 60L * 1'000'000;
  return ret;
}
