#ifndef GRADEBOX_SANDBOX_EXEC_H_
#define GRADEBOX_SANDBOX_EXEC_H_

#include <string>
#include <vector>
#include <sys/types.h>
#include <sys/resource.h>

class CancelToken;

class SandboxOptions {
 public:
  std::vector<std::string> command; // command[0] must be an absolute path
  std::vector<std::string> envs;
  std::string workdir;
  std::string input; // written to the child's stdin, then closed
  long wall_time; // us; must be set
  long cpu_time; // us
  long vss, rss; // KiB; vss is RLIMIT_AS in the child, rss is sampled by the parent
  long fsize; // KiB; files written by the child
  long output; // KiB; cap of each captured stream
  int proc_num;

  SandboxOptions() :
      wall_time(0), cpu_time(0),
      vss(0), rss(0),
      fsize(0), output(0),
      proc_num(0) {}
};

class SandboxResult {
 public:
  bool started; // false if the child could not be set up; error holds errno
  int error;
  int status; // from wait4
  struct rusage rus;
  long time; // us, wall clock
  long peak_rss; // KiB, sampled over the process group; 0 if never sampled
  // set when the parent killed the process group
  bool timekill, outputkill, rsskill, cancelkill;
  std::string out, err;
  bool out_truncated, err_truncated;

  SandboxResult() :
      started(false), error(0), status(0), rus{}, time(0), peak_rss(0),
      timekill(false), outputkill(false), rsskill(false), cancelkill(false),
      out_truncated(false), err_truncated(false) {}
};

// Owns a process group; the destructor kills every member and reaps the leader.
class ProcessGroup {
  pid_t pgid_;
  bool reaped_;
 public:
  ProcessGroup() : pgid_(-1), reaped_(true) {}
  explicit ProcessGroup(pid_t pid) : pgid_(pid), reaped_(false) {}
  ProcessGroup(const ProcessGroup&) = delete;
  ProcessGroup& operator=(const ProcessGroup&) = delete;
  ~ProcessGroup();

  pid_t Id() const { return pgid_; }
  bool Reaped() const { return reaped_; }
  void Kill();
  // nonblocking when hang = false; returns true once the leader was reaped
  bool Wait(int& status, struct rusage& rus, bool hang);
};

// Fork a child in a new process group, apply the rlimits inside it, exec the
// command, feed stdin, capture stdout/stderr and enforce the wall-clock
// deadline, output cap, sampled RSS limit and cancellation from the parent.
// The whole group is killed before returning.
SandboxResult SandboxExec(const SandboxOptions&, const CancelToken* = nullptr);

// sum of the resident sets of every process in the group, KiB
long GroupRss(pid_t pgid);

#endif  // GRADEBOX_SANDBOX_EXEC_H_
