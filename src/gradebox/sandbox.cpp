#include <gradebox/sandbox.h>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <thread>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "paths.h"
#include "sandbox_exec.h"
#include "utils.h"
#include "workspace.h"

int kMaxParallel = std::max(1u, std::thread::hardware_concurrency());

namespace {

constexpr size_t kMaxCompileMessage = 4000;
constexpr int kEnvExitNotFound = 127;
// a program killed by SIGSEGV/SIGABRT this close to the ceiling ran out of memory
constexpr double kMemoryNearLimit = 0.9;
const char kInfraMessage[] = "execution environment unavailable";
// RLIMIT_AS for runtimes whose memory is bounded by the sampled RSS; KiB
constexpr long kResidentVssFactor = 32;
constexpr long kMinResidentVss = 16L * 1024 * 1024;

// Counting semaphore over kMaxParallel; waiting callers still observe cancellation
class SlotPool {
  std::mutex mtx_;
  std::condition_variable cv_;
  size_t running_ = 0;
 public:
  bool Acquire(const CancelToken* cancel) {
    std::unique_lock lck(mtx_);
    while (running_ >= (size_t)std::max(kMaxParallel, 1)) {
      if (cancel && cancel->IsCancelled()) return false;
      cv_.wait_for(lck, std::chrono::milliseconds(50));
    }
    if (cancel && cancel->IsCancelled()) return false;
    running_++;
    return true;
  }
  void Release() {
    {
      std::lock_guard lck(mtx_);
      running_--;
    }
    cv_.notify_one();
  }
  size_t Running() {
    std::lock_guard lck(mtx_);
    return running_;
  }
} slot_pool;

class ExecutionSlot {
  bool acquired_;
 public:
  explicit ExecutionSlot(const CancelToken* cancel) : acquired_(slot_pool.Acquire(cancel)) {}
  ~ExecutionSlot() { if (acquired_) slot_pool.Release(); }
  ExecutionSlot(const ExecutionSlot&) = delete;
  ExecutionSlot& operator=(const ExecutionSlot&) = delete;
  bool Acquired() const { return acquired_; }
};

inline long TimevalUs(const struct timeval& tv) {
  return tv.tv_sec * 1'000'000L + tv.tv_usec;
}

bool ContainsMarker(const std::string& text, const std::vector<std::string>& markers) {
  for (auto& i : markers) {
    if (text.find(i) != std::string::npos) return true;
  }
  return false;
}

// /usr/bin/env reports a missing toolchain as exit 127 with its own prefix
bool IsMissingToolchain(const SandboxResult& res, const std::vector<std::string>& command) {
  if (command.empty() || command[0] != "/usr/bin/env") return false;
  if (!WIFEXITED(res.status) || WEXITSTATUS(res.status) != kEnvExitNotFound) return false;
  return res.err.rfind("/usr/bin/env: ", 0) == 0 || res.err.rfind("env: ", 0) == 0;
}

ExecutionResult InfraError() {
  ExecutionResult ret;
  ret.outcome = Outcome::INFRASTRUCTURE_ERROR;
  ret.exit_code = -1;
  ret.message = kInfraMessage;
  return ret;
}

ExecutionResult Cancelled() {
  ExecutionResult ret;
  ret.outcome = Outcome::CANCELLED;
  ret.exit_code = -SIGKILL;
  return ret;
}

std::vector<std::string> BuildEnvs(const LanguageSpec& spec, const CommandVars& vars) {
  std::vector<std::string> ret;
  const char* path = getenv("PATH");
  ret.push_back(std::string("PATH=") + (path ? path : "/usr/local/bin:/usr/bin:/bin"));
  ret.push_back("LANG=C.UTF-8");
  for (auto& i : ExpandCommand(spec.envs, vars)) ret.push_back(i);
  return ret;
}

CommandVars MakeVars(const fs::path& workspace, const LanguageSpec& spec, long memory) {
  return CommandVars{
    .source = WorkspaceSource(workspace, spec),
    .binary = WorkspaceBinary(workspace, spec),
    .dir = workspace,
    .memory_mib = memory > 0 ? std::max(1L, memory / 1024) : 4096,
  };
}

void ApplyMemoryLimit(SandboxOptions& opt, MemoryPolicy policy, long memory) {
  if (policy == MemoryPolicy::ADDRESS_SPACE) {
    opt.vss = memory;
  } else if (memory > 0) {
    opt.rss = memory;
    opt.vss = std::max(memory * kResidentVssFactor, kMinResidentVss);
  }
}

ExecutionResult FinalizeRun(SandboxResult&& res, const SandboxOptions& opt,
                            const LanguageSpec& spec, const SandboxLimits& limits) {
  if (!res.started || res.error) {
    spdlog::warn("Execution of {} failed to start: {}", spec.id, strerror(res.error));
    return InfraError();
  }
  if (res.cancelkill) return Cancelled();

  ExecutionResult ret;
  ret.stdout_text = std::move(res.out);
  ret.stderr_text = std::move(res.err);
  ret.stdout_truncated = res.out_truncated;
  ret.stderr_truncated = res.err_truncated;
  ret.time = res.time;
  ret.cpu_time = TimevalUs(res.rus.ru_utime) + TimevalUs(res.rus.ru_stime);
  ret.memory = std::max(res.peak_rss, res.rus.ru_maxrss);
  if (WIFSIGNALED(res.status)) {
    ret.exit_code = -WTERMSIG(res.status);
  } else if (WIFEXITED(res.status)) {
    ret.exit_code = WEXITSTATUS(res.status);
  }

  bool near_memory = limits.memory > 0 && ret.memory >= limits.memory * kMemoryNearLimit;
  bool oom_marker = ContainsMarker(ret.stderr_text, spec.oom_markers);
  if (res.timekill) {
    ret.outcome = Outcome::TIMEOUT;
  } else if (res.outputkill || res.rsskill) {
    ret.outcome = Outcome::RESOURCE_LIMIT_EXCEEDED;
  } else if (WIFSIGNALED(res.status)) {
    int sig = WTERMSIG(res.status);
    if (sig == SIGXCPU || sig == SIGXFSZ) {
      ret.outcome = Outcome::RESOURCE_LIMIT_EXCEEDED;
    } else if (sig == SIGKILL && limits.cpu_time > 0 && ret.cpu_time >= limits.cpu_time) {
      // hard RLIMIT_CPU
      ret.outcome = Outcome::RESOURCE_LIMIT_EXCEEDED;
    } else if ((sig == SIGSEGV || sig == SIGABRT || sig == SIGBUS || sig == SIGKILL) &&
               (oom_marker || near_memory)) {
      ret.outcome = Outcome::RESOURCE_LIMIT_EXCEEDED;
    } else {
      ret.outcome = Outcome::RUNTIME_ERROR;
    }
  } else if (ret.exit_code != 0) {
    if (IsMissingToolchain(res, opt.command)) {
      spdlog::warn("Toolchain of {} not found: {}", spec.id, ret.stderr_text);
      return InfraError();
    }
    ret.outcome = oom_marker ? Outcome::RESOURCE_LIMIT_EXCEEDED : Outcome::RUNTIME_ERROR;
  } else {
    ret.outcome = Outcome::OK;
  }
  return ret;
}

std::string BoundCompileMessage(std::string msg) {
  if (msg.size() <= kMaxCompileMessage) return msg;
  size_t total = msg.size();
  msg.resize(kMaxCompileMessage);
  msg += fmt::format("\n... (truncated, {} bytes total)", total);
  return msg;
}

} // namespace

CancelToken::CancelToken() : pipefd_{-1, -1}, cancelled_(false) {
  if (pipe2(pipefd_, O_CLOEXEC | O_NONBLOCK) < 0) {
    spdlog::warn("CancelToken pipe failed: {}", strerror(errno));
    pipefd_[0] = pipefd_[1] = -1;
  }
}

CancelToken::~CancelToken() {
  if (pipefd_[0] >= 0) close(pipefd_[0]);
  if (pipefd_[1] >= 0) close(pipefd_[1]);
}

void CancelToken::Cancel() {
  if (cancelled_.exchange(true)) return;
  // never drained, so the read end stays readable for every waiter
  if (pipefd_[1] >= 0) {
    char c = 0;
    IGNORE_RETURN(write(pipefd_[1], &c, 1));
  }
}

size_t RunningExecutions() {
  return slot_pool.Running();
}

Program::Program(const LanguageSpec& spec) :
    spec_(spec), workspace_(std::make_unique<Workspace>()), run_seq_(0) {}

Program::Program(Program&& x) noexcept :
    spec_(std::move(x.spec_)),
    workspace_(std::move(x.workspace_)),
    compile_result_(std::move(x.compile_result_)),
    run_seq_(x.run_seq_.load()) {}

Program::~Program() = default;

Program Program::Prepare(const LanguageSpec& spec, const std::string& source,
                         const SandboxLimits& limits, const CancelToken* cancel) {
  Program prog(spec);
  auto& ws = *prog.workspace_;
  if (!ws.Valid() || !WriteFile(WorkspaceSource(ws.Path(), spec), source)) {
    prog.compile_result_ = InfraError();
    return prog;
  }
  auto* toolchain = std::get_if<CompileThenRun>(&spec.toolchain);
  if (!toolchain) return prog;

  CommandVars vars = MakeVars(ws.Path(), spec, limits.compile_memory);
  SandboxOptions opt;
  opt.command = ExpandCommand(toolchain->compile, vars);
  opt.envs = BuildEnvs(spec, vars);
  opt.workdir = ws.Path();
  opt.wall_time = limits.compile_wall_time > 0 ? limits.compile_wall_time : limits.wall_time;
  // compilers are trusted toolchains; only the resident set is bounded
  opt.rss = limits.compile_memory;
  opt.output = limits.output;

  SandboxResult res;
  {
    ExecutionSlot slot(cancel);
    if (!slot.Acquired()) {
      prog.compile_result_ = Cancelled();
      return prog;
    }
    res = SandboxExec(opt, cancel);
  }
  auto& ret = prog.compile_result_;
  if (!res.started || res.error) {
    spdlog::warn("Compiler of {} failed to start: {}", spec.id, strerror(res.error));
    ret = InfraError();
  } else if (res.cancelkill) {
    ret = Cancelled();
  } else if (IsMissingToolchain(res, opt.command)) {
    spdlog::warn("Compiler of {} not found: {}", spec.id, res.err);
    ret = InfraError();
  } else {
    bool ok = WIFEXITED(res.status) && WEXITSTATUS(res.status) == 0 &&
        !res.timekill && !res.rsskill && fs::exists(WorkspaceBinary(ws.Path(), spec));
    ret.time = res.time;
    ret.cpu_time = TimevalUs(res.rus.ru_utime) + TimevalUs(res.rus.ru_stime);
    ret.memory = std::max(res.peak_rss, res.rus.ru_maxrss);
    ret.exit_code = WIFSIGNALED(res.status) ? -WTERMSIG(res.status) : WEXITSTATUS(res.status);
    if (!ok) {
      ret.outcome = Outcome::COMPILE_ERROR;
      std::string msg = res.err.empty() ? std::move(res.out) : std::move(res.err);
      if (res.timekill) msg += "\ncompilation timed out";
      if (res.rsskill) msg += "\ncompilation exceeded the memory limit";
      ret.message = BoundCompileMessage(std::move(msg));
    }
  }
  spdlog::info("Workspace {} compiled: language={} outcome={} time={}",
               ws.Id(), spec.id, OutcomeToKey(ret.outcome), ret.time);
  return prog;
}

ExecutionResult Program::Execute(const std::string& input, const SandboxLimits& limits,
                                 const CancelToken* cancel) const {
  if (!Ready()) return compile_result_;
  const fs::path& ws = workspace_->Path();
  long seq = ++run_seq_;
  RunDirectory run_dir(WorkspaceRunDir(ws, seq));
  if (!run_dir.Valid()) return InfraError();

  const CommandTemplate* tpl = nullptr;
  std::visit([&](const auto& toolchain) { tpl = &toolchain.run; }, spec_.toolchain);
  CommandVars vars = MakeVars(ws, spec_, limits.memory);
  SandboxOptions opt;
  opt.command = ExpandCommand(*tpl, vars);
  opt.envs = BuildEnvs(spec_, vars);
  opt.workdir = run_dir.Path();
  opt.input = input;
  opt.wall_time = limits.wall_time;
  opt.cpu_time = limits.cpu_time;
  ApplyMemoryLimit(opt, spec_.memory_policy, limits.memory);
  opt.fsize = limits.output;
  opt.output = limits.output;
  opt.proc_num = limits.proc_num;

  ExecutionSlot slot(cancel);
  if (!slot.Acquired()) return Cancelled();
  auto ret = FinalizeRun(SandboxExec(opt, cancel), opt, spec_, limits);
  spdlog::info("Workspace {} run {}: language={} policy={} outcome={} exit={} time={} memory={}",
               workspace_->Id(), seq, spec_.id, MemoryPolicyName(spec_.memory_policy),
               OutcomeToKey(ret.outcome), ret.exit_code, ret.time, ret.memory);
  return ret;
}

ExecutionResult RunCode(const std::string& language_id, const std::string& source,
                        const std::string& input, const SandboxLimits& limits,
                        const CancelToken* cancel) {
  auto spec = Resolve(language_id);
  if (!spec) {
    ExecutionResult ret;
    ret.outcome = Outcome::UNSUPPORTED_LANGUAGE;
    ret.exit_code = -1;
    ret.message = fmt::format("unsupported language: {}", language_id);
    return ret;
  }
  Program prog = Program::Prepare(*spec, source, limits, cancel);
  if (!prog.Ready()) return prog.CompileResult();
  return prog.Execute(input, limits, cancel);
}
