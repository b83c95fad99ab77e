#ifndef INCLUDE_GRADEBOX_LANGUAGES_H_
#define INCLUDE_GRADEBOX_LANGUAGES_H_

#include <string>
#include <vector>
#include <variant>
#include <optional>

#define ENUM_LANGUAGE_ \
  X(PYTHON, "python") \
  X(JAVASCRIPT, "javascript") \
  X(JAVA, "java") \
  X(CPP, "cpp") \
  X(C, "c") \
  X(GO, "go")
enum class Language {
#define X(name, id) name,
  ENUM_LANGUAGE_
#undef X
};

// Command templates are argv vectors; each element may contain the placeholders
//   {source} {binary} {dir} {memory_mib}
// which are expanded per invocation (see ExpandCommand).
using CommandTemplate = std::vector<std::string>;

struct Interpreted {
  CommandTemplate run;
};
// two child processes sharing the artifact path {binary}
struct CompileThenRun {
  CommandTemplate compile;
  CommandTemplate run;
};
// a single invocation that builds and executes; the build runs under the
// execution limits, output file size included
struct CompileAndRun {
  CommandTemplate run;
};
using Toolchain = std::variant<Interpreted, CompileThenRun, CompileAndRun>;

#define ENUM_MEMORY_POLICY_ \
  X(ADDRESS_SPACE) /* RLIMIT_AS inside the child */ \
  X(RESIDENT) /* runtime reserves huge VSS; parent samples the RSS of the group */
enum class MemoryPolicy {
#define X(name) name,
  ENUM_MEMORY_POLICY_
#undef X
};

struct LanguageSpec {
  Language lang;
  std::string id;
  std::string source_name; // inside the workspace; fixed so that e.g. javac names its class file
  std::string binary_name;
  Toolchain toolchain;
  MemoryPolicy memory_policy;
  std::vector<std::string> envs; // extra "KEY=value" entries; may use placeholders
  std::vector<std::string> oom_markers; // stderr substrings printed on allocation failure

  bool NeedsCompile() const { return std::holds_alternative<CompileThenRun>(toolchain); }
};

struct CommandVars {
  std::string source, binary, dir;
  long memory_mib;
};

// nullopt = unsupported language; performs no filesystem or process work
std::optional<LanguageSpec> Resolve(const std::string& language_id);
std::vector<std::string> ListLanguages();

std::vector<std::string> ExpandCommand(const CommandTemplate&, const CommandVars&);

#endif  // INCLUDE_GRADEBOX_LANGUAGES_H_
