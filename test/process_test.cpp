#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <chrono>
#include <thread>
#include <fstream>
#include <iterator>

#include <gtest/gtest.h>
#include <gradebox/paths.h>
#include <gradebox/process.h>

namespace {

ProcessOptions Shell(const std::string& script, long timeout_ms = 10000) {
  ProcessOptions opt;
  opt.argv = {"/bin/sh", "-c", script};
  opt.timeout_ms = timeout_ms;
  return opt;
}

bool IsZombie(pid_t pid) {
  std::ifstream fin("/proc/" + std::to_string(pid) + "/stat");
  std::string stat((std::istreambuf_iterator<char>(fin)), std::istreambuf_iterator<char>());
  size_t pos = stat.rfind(')');
  return pos != std::string::npos && pos + 2 < stat.size() && stat[pos + 2] == 'Z';
}

// a killed orphan stays a zombie until its new parent reaps it
bool WaitGone(pid_t pid) {
  for (int i = 0; i < 200; i++) {
    if (kill(pid, 0) < 0 && errno == ESRCH) return true;
    if (IsZombie(pid)) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}

} // namespace

TEST(PosixProcessRunnerTest, ExitCodeAndStreams) {
  PosixProcessRunner runner;
  auto res = runner.Run(Shell("echo out; echo err >&2; exit 3"));
  ASSERT_TRUE(res.Started());
  EXPECT_EQ(res.exit_code, 3);
  EXPECT_EQ(res.term_signal, 0);
  EXPECT_EQ(res.stdout_data, "out\n");
  EXPECT_EQ(res.stderr_data, "err\n");
  EXPECT_FALSE(res.timed_out);
  EXPECT_FALSE(res.output_truncated);
}

TEST(PosixProcessRunnerTest, WorkdirAndEnv) {
  fs::path dir = kWorkspaceRoot / "process_workdir";
  fs::create_directories(dir);
  PosixProcessRunner runner;
  auto opt = Shell("pwd; echo $GRADEBOX_VALUE");
  opt.workdir = dir.string();
  opt.envs = {"GRADEBOX_VALUE=42"};
  auto res = runner.Run(opt);
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_EQ(res.stdout_data, fs::canonical(dir).string() + "\n42\n");
  fs::remove_all(dir);
}

TEST(PosixProcessRunnerTest, StdinIsEmpty) {
  PosixProcessRunner runner;
  auto res = runner.Run(Shell("cat", 2000));
  EXPECT_FALSE(res.timed_out);
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_EQ(res.stdout_data, "");
}

TEST(PosixProcessRunnerTest, InheritedDescriptorsClosed) {
  // not close-on-exec, above the fds the runner uses for itself
  int raw = open("/dev/null", O_RDONLY);
  ASSERT_GE(raw, 0);
  int fd = fcntl(raw, F_DUPFD, 20);
  close(raw);
  ASSERT_GE(fd, 20);
  PosixProcessRunner runner;
  auto res = runner.Run(Shell("test -e /proc/$$/fd/" + std::to_string(fd) + " && echo open || echo closed"));
  close(fd);
  EXPECT_EQ(res.stdout_data, "closed\n");
}

TEST(PosixProcessRunnerTest, MissingExecutable) {
  PosixProcessRunner runner;
  ProcessOptions opt;
  opt.argv = {"gradebox-no-such-tool"};
  auto res = runner.Run(opt);
  EXPECT_FALSE(res.Started());
  EXPECT_EQ(res.spawn_errno, ENOENT);

  opt.argv = {"/nonexistent/bin/tool"};
  res = runner.Run(opt);
  EXPECT_EQ(res.spawn_errno, ENOENT);
}

TEST(PosixProcessRunnerTest, MissingWorkdir) {
  PosixProcessRunner runner;
  auto opt = Shell("true");
  opt.workdir = (kWorkspaceRoot / "does_not_exist").string();
  auto res = runner.Run(opt);
  EXPECT_FALSE(res.Started());
  EXPECT_NE(res.spawn_errno, ENOENT);
}

TEST(PosixProcessRunnerTest, ResolveExecutable) {
  int err = 0;
  EXPECT_FALSE(ResolveExecutable("sh", err).empty());
  EXPECT_EQ(err, 0);
  EXPECT_TRUE(ResolveExecutable("gradebox-no-such-tool", err).empty());
  EXPECT_EQ(err, ENOENT);
}

TEST(PosixProcessRunnerTest, TimeoutKillsProcessTree) {
  fs::create_directories(kWorkspaceRoot);
  fs::path pid_file = kWorkspaceRoot / "timeout_child.pid";
  PosixProcessRunner runner;
  auto start = std::chrono::steady_clock::now();
  auto res = runner.Run(Shell("sleep 30 & echo $! > " + pid_file.string() + "; sleep 30", 300));
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_TRUE(res.timed_out);
  EXPECT_NE(res.exit_code, 0);
  EXPECT_LT(elapsed, std::chrono::seconds(3));

  pid_t child = 0;
  std::ifstream(pid_file) >> child;
  ASSERT_GT(child, 0);
  EXPECT_TRUE(WaitGone(child));
}

TEST(PosixProcessRunnerTest, StragglersKilledAfterLeaderExits) {
  PosixProcessRunner runner;
  auto start = std::chrono::steady_clock::now();
  auto res = runner.Run(Shell("sleep 30 >/dev/null 2>&1 & echo $!"));
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_FALSE(res.timed_out);
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_LT(elapsed, std::chrono::seconds(5));
  pid_t child = std::stol(res.stdout_data);
  EXPECT_TRUE(WaitGone(child));
}

TEST(PosixProcessRunnerTest, DescendantInNewSessionKilledAfterLeaderExits) {
  int err = 0;
  if (ResolveExecutable("setsid", err).empty()) GTEST_SKIP() << "setsid not installed";
  PosixProcessRunner runner;
  auto res = runner.Run(Shell("setsid sleep 30 >/dev/null 2>&1 & echo $!; sleep 0.3"));
  EXPECT_FALSE(res.timed_out);
  EXPECT_EQ(res.exit_code, 0);
  pid_t child = std::stol(res.stdout_data);
  ASSERT_GT(child, 0);
  // reaped before Run returns
  EXPECT_EQ(kill(child, 0), -1);
  EXPECT_EQ(errno, ESRCH);
}

TEST(PosixProcessRunnerTest, DescendantInNewSessionKilledOnTimeout) {
  int err = 0;
  if (ResolveExecutable("setsid", err).empty()) GTEST_SKIP() << "setsid not installed";
  fs::create_directories(kWorkspaceRoot);
  fs::path pid_file = kWorkspaceRoot / "session_child.pid";
  PosixProcessRunner runner;
  auto start = std::chrono::steady_clock::now();
  auto res = runner.Run(Shell("setsid sleep 30 >/dev/null 2>&1 & echo $! > " + pid_file.string() +
                              "; sleep 30", 500));
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_TRUE(res.timed_out);
  EXPECT_EQ(res.term_signal, SIGKILL);
  EXPECT_LT(elapsed, std::chrono::seconds(3));

  pid_t child = 0;
  std::ifstream(pid_file) >> child;
  fs::remove(pid_file);
  ASSERT_GT(child, 0);
  EXPECT_EQ(kill(child, 0), -1);
  EXPECT_EQ(errno, ESRCH);
}

TEST(PosixProcessRunnerTest, OutputTruncated) {
  PosixProcessRunner runner;
  auto opt = Shell("head -c 200000 /dev/zero; echo done >&2");
  opt.max_output_bytes = 1000;
  auto res = runner.Run(opt);
  EXPECT_EQ(res.exit_code, 0);
  EXPECT_EQ(res.stdout_data.size(), 1000u);
  EXPECT_EQ(res.stderr_data, "done\n");
  EXPECT_TRUE(res.output_truncated);
}
