#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <map>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include <gtest/gtest.h>
#include <gradebox/task.h>
#include <gradebox/process.h>

// Plays back scripted results instead of spawning anything.
// Every call is recorded together with the files present in its workdir.
class FakeProcessRunner : public ProcessRunner {
  std::mutex mtx_;
 public:
  struct Call {
    ProcessOptions options;
    std::map<std::string, std::string> files; // path relative to workdir -> content
  };
  std::deque<ProcessResult> results; // an empty queue answers exit 0
  std::vector<Call> calls;

  ProcessResult Run(const ProcessOptions&) override;

  static ProcessResult Exit(int code, const std::string& out = "", const std::string& err = "");
  static ProcessResult Timeout();
  static ProcessResult Missing();
};

// go test -json line
std::string GoTestEvent(const std::string& action, const std::string& test = "");

Task WriteTask(long id, Language lang = Language::GO, const std::string& test_code = "");
Task ReviewTask(long id, const std::vector<std::string>& expected_issues);

#endif // TEST_UTILS_H_
