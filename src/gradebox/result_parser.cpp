#include <gradebox/result_parser.h>

#include <cctype>
#include <cstring>
#include <sstream>

#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

inline bool IsToolMissing(int err) {
  return err == ENOENT || err == EACCES;
}

// common handling of a process that never ran to completion;
// returns false if the result should be examined further
bool ClassifyFailedStart(const ProcessResult& res, const std::string& tool, long timeout_ms,
                         OutcomeTag& tag, std::vector<std::string>& errors) {
  if (!res.Started()) {
    if (IsToolMissing(res.spawn_errno)) {
      tag = OutcomeTag::TOOLCHAIN_UNAVAILABLE;
      errors.push_back(fmt::format("{} is not available: {}", tool, strerror(res.spawn_errno)));
    } else {
      tag = OutcomeTag::INTERNAL_ERROR;
      errors.push_back(fmt::format("failed to start {}", tool));
      spdlog::error("Failed to start {}: {}", tool, strerror(res.spawn_errno));
    }
    return true;
  }
  if (res.timed_out) {
    tag = OutcomeTag::TIMEOUT;
    errors.push_back(fmt::format("{} timed out after {} ms", tool, timeout_ms));
    return true;
  }
  return false;
}

std::string DescribeStatus(const ProcessResult& res) {
  if (res.term_signal) return fmt::format("terminated by signal {}", res.term_signal);
  return fmt::format("exited with status {}", res.exit_code);
}

} // namespace

std::vector<std::string> NonEmptyLines(const std::string& str) {
  std::vector<std::string> ret;
  std::istringstream in(str);
  for (std::string line; std::getline(in, line);) {
    while (!line.empty() && isspace((unsigned char)line.back())) line.pop_back();
    size_t first = 0;
    while (first < line.size() && isspace((unsigned char)line[first])) first++;
    if (first == line.size()) continue;
    ret.push_back(std::move(line));
  }
  return ret;
}

TestEventTally ParseTestEvents(const std::string& stream) {
  TestEventTally ret;
  size_t dropped = 0;
  for (auto& line : NonEmptyLines(stream)) {
    nlohmann::json event = nlohmann::json::parse(line, nullptr, false);
    if (event.is_discarded() || !event.is_object()) {
      dropped++;
      continue;
    }
    auto it = event.find("Action");
    if (it != event.end() && it->is_string()) {
      const auto& action = it->get_ref<const std::string&>();
      if (action == "pass") {
        ret.passed++;
      } else if (action == "fail") {
        ret.failed++;
      }
    }
    ret.events.push_back(std::move(event));
  }
  spdlog::debug("Test events: decoded={} dropped={} pass={} fail={}",
                ret.events.size(), dropped, ret.passed, ret.failed);
  return ret;
}

CompileRun ParseCompileRun(ProcessResult&& res, const std::string& tool, long timeout_ms) {
  CompileRun ret;
  if (!ClassifyFailedStart(res, tool, timeout_ms, ret.tag, ret.errors)) {
    if (res.exit_code == 0 && !res.term_signal) {
      ret.tag = OutcomeTag::OK;
      ret.compiled = true;
    } else {
      ret.tag = OutcomeTag::COMPILE_ERROR;
      ret.errors = NonEmptyLines(res.stderr_data);
      if (ret.errors.empty()) ret.errors = NonEmptyLines(res.stdout_data);
      if (ret.errors.empty()) ret.errors.push_back(fmt::format("{} {}", tool, DescribeStatus(res)));
    }
  }
  if (res.output_truncated) spdlog::info("{} output truncated", tool);
  spdlog::info("Compile finished: tool={} tag={} errors={} elapsed={}us",
               tool, OutcomeTagName(ret.tag), ret.errors.size(), res.elapsed_us);
  ret.process = std::move(res);
  return ret;
}

TestRun ParseTestRun(ProcessResult&& res, const std::string& tool, long timeout_ms) {
  TestRun ret;
  TestOutcome& outcome = ret.outcome;
  outcome.exit_code = res.exit_code;
  if (!ClassifyFailedStart(res, tool, timeout_ms, ret.tag, ret.errors)) {
    TestEventTally tally = ParseTestEvents(res.stdout_data);
    outcome.passed = res.exit_code == 0 && !res.term_signal;
    outcome.passed_count = tally.passed;
    outcome.failed_count = tally.failed;
    outcome.events = std::move(tally.events);
    // the exit code decides; a disagreeing tally is only reported
    outcome.tally_consistent = outcome.passed == (tally.failed == 0);
    if (!outcome.tally_consistent) {
      spdlog::warn("{} {} but reported {} passing and {} failing events",
                   tool, DescribeStatus(res), tally.passed, tally.failed);
    }
    ret.tag = outcome.passed ? OutcomeTag::OK : OutcomeTag::TEST_FAILURE;
  }
  outcome.output = res.stdout_data;
  outcome.error_output = res.stderr_data;
  spdlog::info("Tests finished: tool={} tag={} pass={} fail={} elapsed={}us",
               tool, OutcomeTagName(ret.tag), outcome.passed_count, outcome.failed_count,
               res.elapsed_us);
  ret.process = std::move(res);
  return ret;
}

Outcome NormalizeReport(const DriverReport& report) {
  Outcome ret;
  const CompileRun& compile = std::holds_alternative<BuildTestReport>(report) ?
      std::get<BuildTestReport>(report).compile : std::get<CompileOnlyReport>(report).compile;
  ret.tag = compile.tag;
  ret.compiled = compile.compiled;
  ret.errors = compile.errors;
  ret.output = compile.process.stdout_data;
  ret.elapsed_us = compile.process.elapsed_us;

  auto build = std::get_if<BuildTestReport>(&report);
  if (!build || !build->test) return ret;
  const TestRun& test = *build->test;
  ret.elapsed_us += test.process.elapsed_us;
  ret.tests = test.outcome;
  ret.tag = test.tag;
  ret.errors.insert(ret.errors.end(), test.errors.begin(), test.errors.end());
  // a run that never finished is reported as a compile-class failure
  if (test.tag == OutcomeTag::TIMEOUT) ret.compiled = false;
  return ret;
}
