#ifndef INCLUDE_GRADEBOX_PROCESS_H_
#define INCLUDE_GRADEBOX_PROCESS_H_

#include <string>
#include <vector>

struct ProcessOptions {
  std::vector<std::string> argv;
  std::string workdir;
  long timeout_ms; // 0 for no limit
  std::vector<std::string> envs; // "KEY=value", appended to the inherited environment
  long max_output_bytes; // per stream; 0 for no limit

  ProcessOptions() : timeout_ms(0), max_output_bytes(0) {}
};

struct ProcessResult {
  int exit_code; // -1 if killed by a signal or never started
  int term_signal;
  std::string stdout_data, stderr_data;
  bool timed_out;
  bool output_truncated;
  int spawn_errno; // nonzero if the program could not be started
  long elapsed_us;

  ProcessResult() :
      exit_code(-1), term_signal(0), timed_out(false), output_truncated(false),
      spawn_errno(0), elapsed_us(0) {}

  bool Started() const { return spawn_errno == 0; }
};

// The only place the engine touches the host's process API
class ProcessRunner {
 public:
  virtual ~ProcessRunner() = default;
  virtual ProcessResult Run(const ProcessOptions&) = 0;
};

// fork/exec under a per-call supervisor that is the subreaper of the program's
// tree. On timeout, or as soon as the program exits, every descendant is
// SIGKILLed, including ones that moved to another process group or session.
class PosixProcessRunner : public ProcessRunner {
 public:
  ProcessResult Run(const ProcessOptions&) override;
};

// Searches PATH (or checks the path itself if it contains '/').
// Returns empty string and sets err to ENOENT/EACCES on failure.
std::string ResolveExecutable(const std::string& name, int& err);

#endif  // INCLUDE_GRADEBOX_PROCESS_H_
