#include <gradebox/languages.h>

#include <fmt/format.h>
#include "utils.h"

namespace {

const std::vector<LanguageSpec>& Registry() {
  static const std::vector<LanguageSpec> kRegistry = {
    {
      Language::PYTHON, LanguageId(Language::PYTHON), "main.py", "main.py",
      Interpreted{{"/usr/bin/env", "python3", "{source}"}},
      MemoryPolicy::ADDRESS_SPACE,
      {"PYTHONDONTWRITEBYTECODE=1", "PYTHONIOENCODING=utf-8"},
      {"MemoryError"},
    },
    {
      Language::JAVASCRIPT, LanguageId(Language::JAVASCRIPT), "main.js", "main.js",
      Interpreted{{"/usr/bin/env", "node", "--max-old-space-size={memory_mib}", "{source}"}},
      // V8 reserves far more address space than it uses
      MemoryPolicy::RESIDENT,
      {"HOME={dir}"},
      {"heap out of memory", "Allocation failed"},
    },
    {
      // javac names the class file after the public class, so the source must be Main.java
      Language::JAVA, LanguageId(Language::JAVA), "Main.java", "Main.class",
      CompileThenRun{
        {"/usr/bin/env", "javac", "-encoding", "UTF-8", "-d", "{dir}", "{source}"},
        {"/usr/bin/env", "java", "-Xmx{memory_mib}m", "-Xss64m", "-XX:+UseSerialGC",
         "-cp", "{dir}", "Main"},
      },
      MemoryPolicy::RESIDENT,
      {"HOME={dir}"},
      {"java.lang.OutOfMemoryError"},
    },
    {
      Language::CPP, LanguageId(Language::CPP), "main.cpp", "main",
      CompileThenRun{
        {"/usr/bin/env", "g++", "-std=c++17", "-O2", "-pipe", "-w", "-o", "{binary}", "{source}"},
        {"{binary}"},
      },
      MemoryPolicy::ADDRESS_SPACE,
      {},
      {"std::bad_alloc"},
    },
    {
      Language::C, LanguageId(Language::C), "main.c", "main",
      CompileThenRun{
        {"/usr/bin/env", "gcc", "-std=c11", "-O2", "-pipe", "-w", "-o", "{binary}", "{source}", "-lm"},
        {"{binary}"},
      },
      MemoryPolicy::ADDRESS_SPACE,
      {},
      {},
    },
    {
      // built under the compile limits: the toolchain writes package archives
      // larger than the output cap applied to the program itself
      Language::GO, LanguageId(Language::GO), "main.go", "main",
      CompileThenRun{
        {"/usr/bin/env", "go", "build", "-p", "2", "-o", "{binary}", "{source}"},
        {"{binary}"},
      },
      // the go runtime reserves large arenas up front
      MemoryPolicy::RESIDENT,
      {"HOME={dir}", "GOCACHE={dir}/.gocache", "GOPATH={dir}/.gopath", "GO111MODULE=off", "CGO_ENABLED=0"},
      {"out of memory"},
    },
  };
  return kRegistry;
}

} // namespace

std::optional<LanguageSpec> Resolve(const std::string& language_id) {
  for (auto& spec : Registry()) {
    if (spec.id == language_id) return spec;
  }
  return std::nullopt;
}

std::vector<std::string> ListLanguages() {
  std::vector<std::string> ret;
  for (auto& spec : Registry()) ret.push_back(spec.id);
  return ret;
}

std::vector<std::string> ExpandCommand(const CommandTemplate& tpl, const CommandVars& vars) {
  std::vector<std::string> ret;
  ret.reserve(tpl.size());
  for (auto& arg : tpl) {
    ret.push_back(fmt::format(fmt::runtime(arg),
        fmt::arg("source", vars.source),
        fmt::arg("binary", vars.binary),
        fmt::arg("dir", vars.dir),
        fmt::arg("memory_mib", vars.memory_mib)));
  }
  return ret;
}
