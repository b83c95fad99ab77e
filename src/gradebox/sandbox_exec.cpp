#include "sandbox_exec.h"

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <dirent.h>
#include <unistd.h>
#include <sys/wait.h>
#include <chrono>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <mutex>
#include <sstream>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <gradebox/sandbox.h>
#include "utils.h"

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kPollIntervalMs = 20;
// descendants that escaped the group (setsid) may keep the pipes open after the leader exits
constexpr int kDrainGraceMs = 200;
constexpr size_t kReadChunk = 65536;
constexpr int kChildFailureExit = 127;

std::once_flag sigpipe_flag;

inline long ElapsedUs(Clock::time_point since) {
  return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - since).count();
}

class UniqueFd {
  int fd_;
 public:
  UniqueFd() : fd_(-1) {}
  ~UniqueFd() { Close(); }
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  int Get() const { return fd_; }
  void Reset(int fd) { Close(); fd_ = fd; }
  void Close() {
    if (fd_ >= 0) close(fd_);
    fd_ = -1;
  }
};

bool OpenPipe(UniqueFd& read_end, UniqueFd& write_end) {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) < 0) return false;
  read_end.Reset(fds[0]);
  write_end.Reset(fds[1]);
  return true;
}

inline bool SetNonblock(int fd) {
  int flags = fcntl(fd, F_GETFL);
  return flags >= 0 && fcntl(fd, F_SETFL, flags | O_NONBLOCK) >= 0;
}

struct ChildArgs {
  char* const* argv;
  char* const* envp;
  const char* workdir;
  int in_fd, out_fd, err_fd, report_fd;
  rlim_t cpu_sec, vss, fsize, proc_num; // 0 = unlimited
};

// report errno through report_fd and die; exec success closes report_fd instead
[[noreturn]] void ChildFail(int report_fd) {
  int err = errno;
  IGNORE_RETURN(write(report_fd, &err, sizeof(err)));
  _exit(kChildFailureExit);
}

// Runs between fork and exec: only async-signal-safe calls, no allocation, no logging
[[noreturn]] void Child(const ChildArgs& args) {
  constexpr int kReportFd = 3;
  if (setpgid(0, 0) < 0) ChildFail(args.report_fd);
  sigset_t empty;
  sigemptyset(&empty);
  sigprocmask(SIG_SETMASK, &empty, nullptr);
  signal(SIGPIPE, SIG_DFL); // ignored dispositions survive exec
  if (dup2(args.in_fd, 0) < 0 || dup2(args.out_fd, 1) < 0 || dup2(args.err_fd, 2) < 0 ||
      dup2(args.report_fd, kReportFd) < 0) {
    ChildFail(args.report_fd);
  }
  if (fcntl(kReportFd, F_SETFD, FD_CLOEXEC) < 0 || CloseFrom(kReportFd + 1) < 0) ChildFail(kReportFd);

  auto SetLimit = [](int resource, rlim_t soft, rlim_t hard) {
    struct rlimit lim = {soft, hard};
    if (setrlimit(resource, &lim) < 0) ChildFail(kReportFd);
  };
  SetLimit(RLIMIT_CORE, 0, 0);
  // SIGXCPU at the soft limit, SIGKILL one second later
  if (args.cpu_sec) SetLimit(RLIMIT_CPU, args.cpu_sec, args.cpu_sec + 1);
  if (args.vss) SetLimit(RLIMIT_AS, args.vss, args.vss);
  if (args.fsize) SetLimit(RLIMIT_FSIZE, args.fsize, args.fsize);
  if (args.proc_num) SetLimit(RLIMIT_NPROC, args.proc_num, args.proc_num);

  if (chdir(args.workdir) < 0) ChildFail(kReportFd);
  execve(args.argv[0], args.argv, args.envp);
  ChildFail(kReportFd);
}

} // namespace

ProcessGroup::~ProcessGroup() {
  if (reaped_) return;
  int status;
  struct rusage rus;
  Kill();
  Wait(status, rus, true);
}

void ProcessGroup::Kill() {
  // the leader is not reaped yet, so its pid (and thus the group id) cannot be reused
  if (reaped_) return;
  if (killpg(pgid_, SIGKILL) < 0 && errno != ESRCH) {
    spdlog::warn("killpg {} failed: {}", pgid_, strerror(errno));
  }
}

bool ProcessGroup::Wait(int& status, struct rusage& rus, bool hang) {
  if (reaped_) return true;
  siginfo_t info = {};
  int flags = WEXITED | WNOWAIT | (hang ? 0 : WNOHANG);
  while (waitid(P_PID, pgid_, &info, flags) < 0) {
    if (errno == EINTR) continue;
    spdlog::warn("waitid {} failed: {}", pgid_, strerror(errno));
    return false;
  }
  if (info.si_pid == 0) return false; // still running
  // the leader is a zombie now; take the rest of the group down before releasing the id
  Kill();
  while (wait4(pgid_, &status, 0, &rus) < 0) {
    if (errno == EINTR) continue;
    spdlog::warn("wait4 {} failed: {}", pgid_, strerror(errno));
    break;
  }
  reaped_ = true;
  return true;
}

long GroupRss(pid_t pgid) {
  static const long kPageKib = sysconf(_SC_PAGESIZE) / 1024;
  long total = 0;
  DIR* proc = opendir("/proc");
  if (!proc) return 0;
  for (struct dirent* dent; (dent = readdir(proc));) {
    if (dent->d_name[0] < '0' || dent->d_name[0] > '9') continue;
    std::ifstream fin(std::string("/proc/") + dent->d_name + "/stat");
    std::string line;
    if (!std::getline(fin, line)) continue; // exited meanwhile
    // the command name may contain spaces; fields restart after the last ')'
    size_t pos = line.rfind(')');
    if (pos == std::string::npos) continue;
    std::istringstream fields(line.substr(pos + 1));
    std::string field;
    long pgrp = -1, rss = 0;
    // field 3 (state) is the first one after ')'; pgrp is field 5, rss is field 24
    for (int idx = 3; idx <= 24 && fields >> field; idx++) {
      if (idx == 5) pgrp = std::strtol(field.c_str(), nullptr, 10);
      if (idx == 24) rss = std::strtol(field.c_str(), nullptr, 10);
    }
    if (pgrp == pgid) total += rss * kPageKib;
  }
  closedir(proc);
  return total;
}

SandboxResult SandboxExec(const SandboxOptions& opt, const CancelToken* cancel) {
  std::call_once(sigpipe_flag, []() { signal(SIGPIPE, SIG_IGN); });
  SandboxResult ret;
  spdlog::debug("SandboxExec command={} workdir={} wall={} cpu={} vss={} rss={} output={}",
                fmt::format("{}", opt.command), opt.workdir, opt.wall_time, opt.cpu_time,
                opt.vss, opt.rss, opt.output);
  if (opt.command.empty() || opt.wall_time <= 0) {
    ret.error = EINVAL;
    return ret;
  }

  // everything the child touches is allocated before fork
  std::vector<char*> argv_buf, env_buf;
  for (auto& i : opt.command) argv_buf.push_back(const_cast<char*>(i.c_str()));
  argv_buf.push_back(nullptr);
  for (auto& i : opt.envs) env_buf.push_back(const_cast<char*>(i.c_str()));
  env_buf.push_back(nullptr);

  UniqueFd in_read, in_write, out_read, out_write, err_read, err_write, report_read, report_write;
  if (!OpenPipe(in_read, in_write) || !OpenPipe(out_read, out_write) ||
      !OpenPipe(err_read, err_write) || !OpenPipe(report_read, report_write)) {
    ret.error = errno;
    spdlog::warn("SandboxExec pipe error: {}", strerror(ret.error));
    return ret;
  }
  ChildArgs args{};
  args.argv = argv_buf.data();
  args.envp = env_buf.data();
  args.workdir = opt.workdir.c_str();
  args.in_fd = in_read.Get();
  args.out_fd = out_write.Get();
  args.err_fd = err_write.Get();
  args.report_fd = report_write.Get();
  args.cpu_sec = opt.cpu_time > 0 ? (opt.cpu_time + 999'999) / 1'000'000 : 0;
  args.vss = opt.vss > 0 ? (rlim_t)opt.vss * 1024 : 0;
  args.fsize = opt.fsize > 0 ? (rlim_t)opt.fsize * 1024 : 0;
  args.proc_num = opt.proc_num > 0 ? opt.proc_num : 0;

  auto start = Clock::now();
  pid_t pid = fork();
  if (pid < 0) {
    ret.error = errno;
    spdlog::warn("SandboxExec fork error: {}", strerror(ret.error));
    return ret;
  }
  if (pid == 0) Child(args);

  // also from the parent, so that killpg works even if the child has not run yet
  setpgid(pid, pid);
  ProcessGroup group(pid);
  in_read.Close();
  out_write.Close();
  err_write.Close();
  report_write.Close();
  {
    int child_errno = 0;
    ssize_t n;
    while ((n = read(report_read.Get(), &child_errno, sizeof(child_errno))) < 0 && errno == EINTR);
    if (n == sizeof(child_errno)) {
      ret.error = child_errno;
      spdlog::warn("SandboxExec child setup failed: command={} errno={} {}",
                   opt.command[0], child_errno, strerror(child_errno));
      group.Wait(ret.status, ret.rus, true);
      return ret;
    }
  }
  ret.started = true;
  spdlog::debug("SandboxExec pid={} started", pid);

  if (!SetNonblock(in_write.Get()) || !SetNonblock(out_read.Get()) || !SetNonblock(err_read.Get())) {
    ret.error = errno;
    return ret; // group is killed by its destructor
  }
  size_t in_pos = 0;
  if (opt.input.empty()) in_write.Close();

  const size_t cap = opt.output > 0 ? (size_t)opt.output * 1024 : SIZE_MAX;
  const auto deadline = start + std::chrono::microseconds(opt.wall_time);
  const int cancel_fd = cancel ? cancel->Fd() : -1;
  bool exited = false;
  Clock::time_point drain_deadline;
  char buf[kReadChunk];

  auto ReadStream = [&](UniqueFd& fd, std::string& target, bool& truncated) {
    ssize_t n = read(fd.Get(), buf, sizeof(buf));
    if (n < 0) {
      if (errno != EAGAIN && errno != EINTR) fd.Close();
      return;
    }
    if (n == 0) {
      fd.Close();
      return;
    }
    size_t room = cap - std::min(cap, target.size());
    target.append(buf, std::min(room, (size_t)n));
    if ((size_t)n > room) {
      truncated = true;
      ret.outputkill = true;
    }
  };

  while (true) {
    auto now = Clock::now();
    if (exited) {
      if ((out_read.Get() < 0 && err_read.Get() < 0) || now >= drain_deadline) break;
    } else if (now >= deadline) {
      ret.timekill = true;
      break;
    }
    struct pollfd fds[4];
    int nfds = 0, in_idx = -1, out_idx = -1, err_idx = -1;
    if (in_write.Get() >= 0) in_idx = nfds, fds[nfds++] = {in_write.Get(), POLLOUT, 0};
    if (out_read.Get() >= 0) out_idx = nfds, fds[nfds++] = {out_read.Get(), POLLIN, 0};
    if (err_read.Get() >= 0) err_idx = nfds, fds[nfds++] = {err_read.Get(), POLLIN, 0};
    if (cancel_fd >= 0) fds[nfds++] = {cancel_fd, POLLIN, 0};
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        (exited ? drain_deadline : deadline) - now).count() + 1;
    int timeout = (int)std::min<long>(remaining, kPollIntervalMs);
    if (poll(fds, nfds, timeout) < 0 && errno != EINTR) {
      ret.error = errno;
      spdlog::warn("SandboxExec poll error: {}", strerror(ret.error));
      break;
    }
    if (cancel && cancel->IsCancelled()) {
      ret.cancelkill = true;
      break;
    }
    if (in_idx >= 0 && fds[in_idx].revents) {
      ssize_t n = write(in_write.Get(), opt.input.data() + in_pos,
                        std::min(opt.input.size() - in_pos, kReadChunk));
      if (n > 0) {
        in_pos += n;
        if (in_pos == opt.input.size()) in_write.Close();
      } else if (n < 0 && errno != EAGAIN && errno != EINTR) {
        in_write.Close(); // EPIPE: the program stopped reading
      }
    }
    if (out_idx >= 0 && fds[out_idx].revents) ReadStream(out_read, ret.out, ret.out_truncated);
    if (err_idx >= 0 && fds[err_idx].revents) ReadStream(err_read, ret.err, ret.err_truncated);
    if (ret.outputkill) break;
    if (!exited) {
      if (opt.rss > 0) {
        long rss = GroupRss(group.Id());
        ret.peak_rss = std::max(ret.peak_rss, rss);
        if (rss > opt.rss) {
          ret.rsskill = true;
          break;
        }
      }
      if (group.Wait(ret.status, ret.rus, false)) {
        exited = true;
        in_write.Close();
        drain_deadline = Clock::now() + std::chrono::milliseconds(kDrainGraceMs);
      }
    }
  }
  if (!exited) {
    group.Kill();
    group.Wait(ret.status, ret.rus, true);
  }
  ret.time = ElapsedUs(start);
  spdlog::debug("SandboxExec pid={} finished status={} time={} timekill={} outputkill={} rsskill={} cancelkill={}",
                pid, ret.status, ret.time, ret.timekill, ret.outputkill, ret.rsskill, ret.cancelkill);
  return ret;
}
