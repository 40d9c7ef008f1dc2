#ifndef INCLUDE_GRADEBOX_OUTCOME_H_
#define INCLUDE_GRADEBOX_OUTCOME_H_

#include <string>
#include <vector>
#include <optional>

#include <nlohmann/json.hpp>

// ordered by severity of the infrastructure signal
#define ENUM_OUTCOME_TAG_ \
  X(OK, "ok") \
  X(COMPILE_ERROR, "compile_error") \
  X(TEST_FAILURE, "test_failure") \
  X(TIMEOUT, "timeout") \
  X(TOOLCHAIN_UNAVAILABLE, "toolchain_unavailable") \
  X(INTERNAL_ERROR, "internal_error")
enum class OutcomeTag {
#define X(name, str) name,
  ENUM_OUTCOME_TAG_
#undef X
};

// Outcome of the test phase. passed follows the runner's exit code;
// the counters come from the event stream and are informational only.
struct TestOutcome {
  bool passed;
  int exit_code;
  int passed_count, failed_count;
  bool tally_consistent;
  std::string output, error_output;
  std::vector<nlohmann::json> events;

  TestOutcome() :
      passed(false), exit_code(-1), passed_count(0), failed_count(0),
      tally_consistent(true) {}
};

// Language-agnostic result of one verification; compile-only drivers
// leave tests empty
struct Outcome {
  OutcomeTag tag;
  bool compiled;
  std::vector<std::string> errors;
  std::string output;
  std::optional<TestOutcome> tests;
  long elapsed_us;

  Outcome() : tag(OutcomeTag::OK), compiled(false), elapsed_us(0) {}

  // compiled AND (tests passed, if a test phase ran)
  bool Passed() const {
    return compiled && (!tests || tests->passed);
  }
  bool IsInfrastructureFailure() const {
    return tag == OutcomeTag::TOOLCHAIN_UNAVAILABLE || tag == OutcomeTag::INTERNAL_ERROR;
  }
};

#endif  // INCLUDE_GRADEBOX_OUTCOME_H_
