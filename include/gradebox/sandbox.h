#ifndef INCLUDE_GRADEBOX_SANDBOX_H_
#define INCLUDE_GRADEBOX_SANDBOX_H_

#include <atomic>
#include <memory>
#include <string>

#include <gradebox/languages.h>

// Maximum number of child programs (compile or run) alive at the same time
extern int kMaxParallel;

// terminal outcome of a single execution
#define ENUM_OUTCOME_ \
  X(OK, "ok", "Success") \
  X(RUNTIME_ERROR, "runtime_error", "Runtime Error (exited with nonzero status or signal)") \
  X(TIMEOUT, "timeout", "Wall-clock Deadline Exceeded") \
  X(RESOURCE_LIMIT_EXCEEDED, "resource_limit_exceeded", "CPU, Memory or Output Limit Exceeded") \
  X(COMPILE_ERROR, "compile_error", "Compile Error") \
  X(CANCELLED, "cancelled", "Cancelled") \
  /* not student-visible */ \
  X(UNSUPPORTED_LANGUAGE, "unsupported_language", "Unsupported Language") \
  X(INFRASTRUCTURE_ERROR, "infrastructure_error", "Infrastructure Error")
enum class Outcome {
#define X(name, key, desc) name,
  ENUM_OUTCOME_
#undef X
};

struct SandboxLimits {
  // zero = unlimited, except wall_time which must always be set
  long wall_time; // us; the deadline enforced by the parent
  long cpu_time; // us
  long memory; // KiB
  long output; // KiB; per captured stream
  int proc_num; // RLIMIT_NPROC, counted per uid across the host
  long compile_wall_time; // us
  long compile_memory; // KiB

  SandboxLimits() :
      wall_time(10L * 1'000'000),
      cpu_time(10L * 1'000'000),
      memory(256L * 1024),
      output(1024),
      proc_num(0),
      compile_wall_time(30L * 1'000'000),
      compile_memory(1024L * 1024) {}
};

struct ExecutionResult {
  Outcome outcome;
  std::string stdout_text, stderr_text;
  bool stdout_truncated, stderr_truncated;
  int exit_code; // -signal if killed by a signal
  long time; // us, wall clock
  long cpu_time; // us, user + sys
  long memory; // KiB, peak resident; 0 if not observable
  // compile diagnostics for COMPILE_ERROR; a generic description for
  // INFRASTRUCTURE_ERROR and UNSUPPORTED_LANGUAGE
  std::string message;

  ExecutionResult() :
      outcome(Outcome::OK),
      stdout_truncated(false), stderr_truncated(false),
      exit_code(0), time(0), cpu_time(0), memory(0) {}
  bool Success() const { return outcome == Outcome::OK; }
};

// Cancellation of an in-flight execution from another thread.
// A cancelled token stays cancelled; every execution using it is killed promptly.
class CancelToken {
  int pipefd_[2];
  std::atomic_bool cancelled_;
 public:
  CancelToken();
  ~CancelToken();
  CancelToken(const CancelToken&) = delete;
  CancelToken& operator=(const CancelToken&) = delete;

  void Cancel();
  bool IsCancelled() const { return cancelled_; }
  // readable once cancelled; -1 if the token could not allocate its pipe
  int Fd() const { return pipefd_[0]; }
};

class Workspace;

// A program materialized in its own workspace, compiled once and executable
// many times. The workspace and every process are released by the destructor.
class Program {
  LanguageSpec spec_;
  std::unique_ptr<Workspace> workspace_;
  ExecutionResult compile_result_;
  mutable std::atomic_long run_seq_;

  Program(const LanguageSpec&);
 public:
  Program(Program&&) noexcept;
  ~Program();

  // Writes the source and runs the compile step if the language has one.
  // Never throws for compile failures; check Ready() and CompileResult().
  static Program Prepare(const LanguageSpec&, const std::string& source,
                         const SandboxLimits&, const CancelToken* = nullptr);

  bool Ready() const { return compile_result_.outcome == Outcome::OK; }
  const ExecutionResult& CompileResult() const { return compile_result_; }
  const LanguageSpec& Spec() const { return spec_; }

  // each call runs in a fresh working directory inside the workspace
  ExecutionResult Execute(const std::string& input, const SandboxLimits&,
                          const CancelToken* = nullptr) const;
};

// One-shot: resolve, prepare, execute, clean up.
ExecutionResult RunCode(const std::string& language_id, const std::string& source,
                        const std::string& input, const SandboxLimits&,
                        const CancelToken* = nullptr);

// number of executions currently holding a slot
size_t RunningExecutions();

#endif  // INCLUDE_GRADEBOX_SANDBOX_H_
