#include <gradebox/process.h>

#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <sys/prctl.h>
#include <chrono>
#include <cstring>
#include <cstdlib>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "utils.h"

extern char** environ;

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kPollSliceMs = 50;
// fds the exec status and the leader's wait status are reported on
constexpr int kStatusFd = 3;
constexpr int kReportFd = 4;

// child -> parent report if the program never started
struct SpawnFailure {
  int err;
};

inline long ElapsedUs(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start).count();
}

std::string FindEnv(const std::vector<std::string>& envs, const std::string& key) {
  std::string ret;
  bool found = false;
  for (auto& i : envs) {
    if (i.compare(0, key.size() + 1, key + "=") == 0) {
      ret = i.substr(key.size() + 1);
      found = true;
    }
  }
  if (found) return ret;
  if (const char* val = getenv(key.c_str())) return val;
  return "";
}

// inherited environment with overrides applied
std::vector<std::string> MergeEnv(const std::vector<std::string>& envs) {
  std::vector<std::string> ret;
  auto Overridden = [&](const std::string& entry) {
    size_t eq = entry.find('=');
    std::string key = entry.substr(0, eq);
    for (auto& i : envs) {
      if (i.compare(0, key.size() + 1, key + "=") == 0) return true;
    }
    return false;
  };
  for (char** env = environ; env && *env; env++) {
    std::string entry(*env);
    if (!Overridden(entry)) ret.push_back(std::move(entry));
  }
  ret.insert(ret.end(), envs.begin(), envs.end());
  return ret;
}

std::string SearchPath(const std::string& name, const std::string& path, int& err) {
  bool denied = false;
  size_t start = 0;
  while (start <= path.size()) {
    size_t end = path.find(':', start);
    if (end == std::string::npos) end = path.size();
    std::string dir = path.substr(start, end - start);
    if (dir.empty()) dir = ".";
    std::string candidate = dir + "/" + name;
    if (access(candidate.c_str(), X_OK) == 0) {
      std::error_code ec;
      if (!fs::is_directory(candidate, ec)) return candidate;
    } else if (errno == EACCES) {
      denied = true;
    }
    start = end + 1;
  }
  err = denied ? EACCES : ENOENT;
  return "";
}

std::string Resolve(const std::string& name, const std::string& path, int& err) {
  err = 0;
  if (name.empty()) {
    err = ENOENT;
    return "";
  }
  if (name.find('/') == std::string::npos) {
    return SearchPath(name, path.empty() ? "/usr/local/bin:/usr/bin:/bin" : path, err);
  }
  if (access(name.c_str(), X_OK) < 0) {
    err = errno == EACCES ? EACCES : ENOENT;
    return "";
  }
  std::error_code ec;
  if (fs::is_directory(name, ec)) {
    err = EACCES;
    return "";
  }
  return name;
}

// false on EOF or unrecoverable error; data beyond limit is read and dropped
bool DrainFd(int fd, std::string& buf, long limit, bool& truncated) {
  char tmp[65536];
  ssize_t n = read(fd, tmp, sizeof(tmp));
  if (n < 0) return errno == EINTR || errno == EAGAIN;
  if (n == 0) return false;
  size_t keep = n;
  if (limit > 0 && buf.size() + n > (size_t)limit) {
    keep = buf.size() < (size_t)limit ? limit - buf.size() : 0;
    truncated = true;
  }
  buf.append(tmp, keep);
  return true;
}

// exited (or killed) but not yet reaped
bool Exited(pid_t pid) {
  siginfo_t info{};
  if (waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) < 0) return errno == ECHILD;
  return info.si_pid == pid;
}

void ClosePipe(int fds[2]) {
  for (int i = 0; i < 2; i++) {
    if (fds[i] >= 0) close(fds[i]);
    fds[i] = -1;
  }
}

// The functions below run in the forked supervisor and must stay
// async-signal-safe: no allocation, no logging.

// leader pid while the supervisor waits for it
volatile sig_atomic_t supervised_leader = 0;

void KillLeaderGroup(int) {
  if (supervised_leader > 0) killpg(supervised_leader, SIGKILL);
}

// SIGKILL every direct child; false if the children list is unreadable
bool KillChildren() {
  int fd = open("/proc/thread-self/children", O_RDONLY | O_CLOEXEC);
  if (fd < 0) return false;
  char buf[4096];
  pid_t cur = 0;
  ssize_t n;
  while ((n = read(fd, buf, sizeof(buf))) > 0) {
    for (ssize_t i = 0; i < n; i++) {
      if (buf[i] >= '0' && buf[i] <= '9') {
        cur = cur * 10 + (buf[i] - '0');
      } else if (cur) {
        kill(cur, SIGKILL);
        cur = 0;
      }
    }
  }
  if (cur) kill(cur, SIGKILL);
  close(fd);
  return true;
}

// Subreaper of the leader's tree. Once the leader exits, or SIGTERM arrives,
// every descendant is killed and reaped whatever process group or session it
// moved to; then the leader's wait status goes to kReportFd.
[[noreturn]] void Supervise(const char* exe, const char* workdir, char* const* argv, char* const* envp) {
  struct sigaction act{};
  act.sa_handler = KillLeaderGroup;
  sigemptyset(&act.sa_mask);
  sigaction(SIGTERM, &act, nullptr);
  signal(SIGCHLD, SIG_DFL);
  prctl(PR_SET_CHILD_SUBREAPER, 1);

  SpawnFailure failure{0};
  pid_t leader = fork();
  if (leader == 0) {
    setpgid(0, 0);
    prctl(PR_SET_PDEATHSIG, SIGKILL);
    close(kReportFd);
    if (workdir[0] && chdir(workdir) < 0) {
      failure.err = ENOTDIR;
    } else {
      execve(exe, argv, envp);
      failure.err = errno;
    }
    IGNORE_RETURN(write(kStatusFd, &failure, sizeof(failure)));
    _exit(127);
  }
  if (leader < 0) {
    failure.err = errno;
    IGNORE_RETURN(write(kStatusFd, &failure, sizeof(failure)));
    _exit(127);
  }
  setpgid(leader, leader);
  supervised_leader = leader;
  // the pipes now stay open only as long as something in the tree holds them
  close(kStatusFd);
  close(STDOUT_FILENO);
  close(STDERR_FILENO);

  siginfo_t info{};
  while (waitid(P_PID, leader, &info, WEXITED | WNOWAIT) < 0 && errno == EINTR);
  supervised_leader = 0;
  killpg(leader, SIGKILL); // the zombie leader keeps the pgid reserved
  int status = 0;
  while (waitpid(leader, &status, 0) < 0 && errno == EINTR);
  // orphans of the tree are reparented here
  for (;;) {
    bool listed = KillChildren();
    pid_t r = waitpid(-1, nullptr, listed ? 0 : WNOHANG);
    if (r < 0 && errno == EINTR) continue;
    if (r <= 0) break;
  }
  IGNORE_RETURN(write(kReportFd, &status, sizeof(status)));
  _exit(0);
}

} // namespace

std::string ResolveExecutable(const std::string& name, int& err) {
  return Resolve(name, FindEnv({}, "PATH"), err);
}

ProcessResult PosixProcessRunner::Run(const ProcessOptions& opt) {
  ProcessResult ret;
  auto start = Clock::now();
  if (opt.argv.empty()) {
    ret.spawn_errno = EINVAL;
    return ret;
  }
  std::string exe = Resolve(opt.argv[0], FindEnv(opt.envs, "PATH"), ret.spawn_errno);
  if (exe.empty()) {
    spdlog::info("Cannot start {}: {}", opt.argv[0], strerror(ret.spawn_errno));
    return ret;
  }
  if (!opt.workdir.empty()) {
    std::error_code ec;
    if (!fs::is_directory(opt.workdir, ec)) {
      spdlog::warn("Working directory {} does not exist", opt.workdir);
      ret.spawn_errno = ENOTDIR;
      return ret;
    }
  }

  // everything the child needs is prepared before fork
  std::vector<std::string> env_strs = MergeEnv(opt.envs);
  std::vector<char*> argv_buf, env_buf;
  for (auto& i : opt.argv) argv_buf.push_back(const_cast<char*>(i.c_str()));
  argv_buf.push_back(nullptr);
  for (auto& i : env_strs) env_buf.push_back(const_cast<char*>(i.c_str()));
  env_buf.push_back(nullptr);

  int outpipe[2] = {-1, -1}, errpipe[2] = {-1, -1}, statpipe[2] = {-1, -1}, reportpipe[2] = {-1, -1};
  int devnull = -1;
  pid_t pid;
  if (pipe2(outpipe, O_CLOEXEC) < 0 || pipe2(errpipe, O_CLOEXEC) < 0 ||
      pipe2(statpipe, O_CLOEXEC) < 0 || pipe2(reportpipe, O_CLOEXEC) < 0 ||
      (devnull = open("/dev/null", O_RDONLY | O_CLOEXEC)) < 0) {
    goto err;
  }
  pid = fork();
  if (pid < 0) goto err;
  if (pid == 0) {
    setpgid(0, 0);
    prctl(PR_SET_PDEATHSIG, SIGKILL);
    sigset_t mask;
    sigemptyset(&mask);
    sigprocmask(SIG_SETMASK, &mask, nullptr);
    signal(SIGPIPE, SIG_DFL);
    // move the report ends above their targets before placing them
    int status_fd = fcntl(statpipe[1], F_DUPFD_CLOEXEC, kReportFd + 1);
    int report_fd = fcntl(reportpipe[1], F_DUPFD_CLOEXEC, kReportFd + 1);
    dup2(devnull, 0);
    dup2(outpipe[1], 1);
    dup2(errpipe[1], 2);
    dup3(status_fd, kStatusFd, O_CLOEXEC);
    dup3(report_fd, kReportFd, O_CLOEXEC);
    CloseFrom(kReportFd + 1);
    Supervise(exe.c_str(), opt.workdir.c_str(), argv_buf.data(), env_buf.data());
  }
  setpgid(pid, pid); // same as the child's call; whichever runs first wins
  spdlog::debug("Process started: supervisor={} argv={} workdir={} timeout={}ms",
                pid, fmt::format("{}", opt.argv), opt.workdir, opt.timeout_ms);
  close(outpipe[1]);
  close(errpipe[1]);
  close(statpipe[1]);
  close(reportpipe[1]);
  close(devnull);
  outpipe[1] = errpipe[1] = statpipe[1] = reportpipe[1] = devnull = -1;

  { // exec status: EOF means exec succeeded (the pipe is close-on-exec)
    SpawnFailure failure{0};
    ssize_t n;
    while ((n = read(statpipe[0], &failure, sizeof(failure))) < 0 && errno == EINTR);
    ClosePipe(statpipe);
    if (n == (ssize_t)sizeof(failure)) {
      waitpid(pid, nullptr, 0);
      ClosePipe(outpipe);
      ClosePipe(errpipe);
      ClosePipe(reportpipe);
      ret.spawn_errno = failure.err;
      ret.elapsed_us = ElapsedUs(start);
      spdlog::info("Failed to exec {}: {}", exe, strerror(failure.err));
      return ret;
    }
  }

  {
    auto deadline = start + std::chrono::milliseconds(opt.timeout_ms);
    bool out_open = true, err_open = true, supervisor_exited = false;
    while (out_open || err_open || !supervisor_exited) {
      int slice = kPollSliceMs;
      if (opt.timeout_ms > 0) {
        auto remain = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        if (remain <= 0) {
          ret.timed_out = true;
          break;
        }
        if (remain < slice) slice = remain;
      }
      if (!supervisor_exited) supervisor_exited = Exited(pid);
      struct pollfd fds[2];
      int nfds = 0;
      if (out_open) fds[nfds++] = {outpipe[0], POLLIN, 0};
      if (err_open) fds[nfds++] = {errpipe[0], POLLIN, 0};
      if (!nfds) {
        usleep(slice * 1000);
        continue;
      }
      int r = poll(fds, nfds, slice);
      if (r < 0) {
        if (errno == EINTR) continue;
        spdlog::warn("poll failed on pid={}: {}", pid, strerror(errno));
        break;
      }
      for (int i = 0; i < nfds; i++) {
        if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
        if (fds[i].fd == outpipe[0]) {
          out_open = DrainFd(outpipe[0], ret.stdout_data, opt.max_output_bytes, ret.output_truncated);
        } else {
          err_open = DrainFd(errpipe[0], ret.stderr_data, opt.max_output_bytes, ret.output_truncated);
        }
      }
    }
  }
  // the supervisor is still unreaped, so its pid cannot have been reused
  if (!Exited(pid) && kill(pid, SIGTERM) < 0) {
    spdlog::warn("Failed signalling supervisor {}: {}", pid, strerror(errno));
  }
  ClosePipe(outpipe);
  ClosePipe(errpipe);
  {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR);
    // the leader's status; the supervisor's own if it never got to report
    while (read(reportpipe[0], &status, sizeof(status)) < 0 && errno == EINTR);
    ClosePipe(reportpipe);
    if (WIFEXITED(status)) {
      ret.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
      ret.term_signal = WTERMSIG(status);
    }
  }
  ret.elapsed_us = ElapsedUs(start);
  if (ret.timed_out) {
    spdlog::info("Process timed out: supervisor={} argv[0]={} elapsed={}us", pid, opt.argv[0], ret.elapsed_us);
  } else {
    spdlog::debug("Process finished: supervisor={} exit={} signal={} elapsed={}us",
                  pid, ret.exit_code, ret.term_signal, ret.elapsed_us);
  }
  return ret;

err:
  ret.spawn_errno = errno;
  spdlog::warn("Failed spawning {}: errno={} {}", opt.argv[0], errno, strerror(errno));
  ClosePipe(outpipe);
  ClosePipe(errpipe);
  ClosePipe(statpipe);
  ClosePipe(reportpipe);
  if (devnull >= 0) close(devnull);
  return ret;
}
