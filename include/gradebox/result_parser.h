#ifndef INCLUDE_GRADEBOX_RESULT_PARSER_H_
#define INCLUDE_GRADEBOX_RESULT_PARSER_H_

#include <string>
#include <vector>
#include <variant>
#include <optional>

#include <gradebox/outcome.h>
#include <gradebox/process.h>

// None of the parsing functions throw; malformed input only reduces
// what is recognized.

struct TestEventTally {
  int passed, failed;
  std::vector<nlohmann::json> events;

  TestEventTally() : passed(0), failed(0) {}
};

// compile phase of any driver
struct CompileRun {
  ProcessResult process;
  OutcomeTag tag;
  bool compiled;
  std::vector<std::string> errors;

  CompileRun() : tag(OutcomeTag::INTERNAL_ERROR), compiled(false) {}
};

// test phase of a build-and-test driver
struct TestRun {
  ProcessResult process;
  OutcomeTag tag;
  TestOutcome outcome;
  std::vector<std::string> errors; // timeout/infrastructure messages only

  TestRun() : tag(OutcomeTag::INTERNAL_ERROR) {}
};

struct BuildTestReport {
  CompileRun compile;
  std::optional<TestRun> test; // empty if not compiled or no test source
};

// stdout is kept in compile.process for later artifact (ABI/bytecode) extraction
struct CompileOnlyReport {
  CompileRun compile;
};

using DriverReport = std::variant<BuildTestReport, CompileOnlyReport>;

// Non-empty lines, trailing CR/whitespace stripped
std::vector<std::string> NonEmptyLines(const std::string&);

// One JSON event per line; undecodable lines are dropped.
// Action "pass"/"fail" are counted, every decoded event is kept.
TestEventTally ParseTestEvents(const std::string& stream);

// what is the tool called in messages
CompileRun ParseCompileRun(ProcessResult&& res, const std::string& tool, long timeout_ms);
TestRun ParseTestRun(ProcessResult&& res, const std::string& tool, long timeout_ms);

Outcome NormalizeReport(const DriverReport&);

#endif  // INCLUDE_GRADEBOX_RESULT_PARSER_H_
