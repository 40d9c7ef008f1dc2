#include "utils.h"

#include <cerrno>
#include <csignal>
#include <fstream>
#include <sstream>
#include <filesystem>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;

ProcessResult FakeProcessRunner::Run(const ProcessOptions& opt) {
  Call call;
  call.options = opt;
  if (!opt.workdir.empty() && fs::is_directory(opt.workdir)) {
    for (auto& entry : fs::recursive_directory_iterator(opt.workdir)) {
      if (!entry.is_regular_file()) continue;
      std::ifstream fin(entry.path());
      std::stringstream ss;
      ss << fin.rdbuf();
      call.files[fs::relative(entry.path(), opt.workdir).string()] = ss.str();
    }
  }
  std::lock_guard lck(mtx_);
  calls.push_back(std::move(call));
  if (results.empty()) return Exit(0);
  ProcessResult ret = std::move(results.front());
  results.pop_front();
  return ret;
}

ProcessResult FakeProcessRunner::Exit(int code, const std::string& out, const std::string& err) {
  ProcessResult ret;
  ret.exit_code = code;
  ret.stdout_data = out;
  ret.stderr_data = err;
  ret.elapsed_us = 1000;
  return ret;
}

ProcessResult FakeProcessRunner::Timeout() {
  ProcessResult ret;
  ret.timed_out = true;
  ret.term_signal = SIGKILL;
  ret.elapsed_us = 2000;
  return ret;
}

ProcessResult FakeProcessRunner::Missing() {
  ProcessResult ret;
  ret.spawn_errno = ENOENT;
  return ret;
}

std::string GoTestEvent(const std::string& action, const std::string& test) {
  nlohmann::json event{{"Action", action}, {"Package", "task"}};
  if (test.size()) event["Test"] = test;
  return event.dump() + "\n";
}

Task WriteTask(long id, Language lang, const std::string& test_code) {
  Task task;
  task.id = id;
  task.kind = TaskKind::WRITE;
  task.lang = lang;
  task.title = "Sum";
  task.starter_code = "package main\n\nfunc Sum(a, b int) int {\n\treturn 0\n}\n";
  task.test_code = test_code;
  task.hints = {"Look at the return statement", "Add a and b", "return a + b"};
  return task;
}

Task ReviewTask(long id, const std::vector<std::string>& expected_issues) {
  Task task;
  task.id = id;
  task.kind = TaskKind::REVIEW;
  task.lang = Language::SOLIDITY;
  task.title = "Vault";
  task.sample_code = "contract Vault { function withdraw() public {} }";
  task.review_questions = {"What can go wrong in withdraw?"};
  task.expected_issues = expected_issues;
  return task;
}
