#ifndef INCLUDE_GRADEBOX_TASK_H_
#define INCLUDE_GRADEBOX_TASK_H_

#include <string>
#include <vector>

#define ENUM_TASK_KIND_ \
  X(WRITE, "write") \
  X(REVIEW, "review")
enum class TaskKind {
#define X(name, str) name,
  ENUM_TASK_KIND_
#undef X
};

#define ENUM_LANGUAGE_ \
  X(GO, "go") \
  X(SOLIDITY, "solidity")
enum class Language {
#define X(name, str) name,
  ENUM_LANGUAGE_
#undef X
};

// Authored externally; read-only to the engine.
// write tasks carry starter_code/test_code/hints,
// review tasks carry sample_code/review_questions/expected_issues
struct Task {
  long id;
  TaskKind kind;
  Language lang;
  std::string title;
  std::string starter_code;
  std::string test_code; // may be empty: compile-only verdict
  std::string solution_code; // optional reference solution
  std::string sample_code;
  std::vector<std::string> review_questions;
  std::vector<std::string> expected_issues;
  std::vector<std::string> hints; // ordered; revealed one per failed retry
  std::string requirements;
  std::vector<std::string> tags;
  int estimated_minutes;

  Task() : id(0), kind(TaskKind::WRITE), lang(Language::GO), estimated_minutes(0) {}
};

// Checks the write/review field invariant; message is set on failure
bool ValidateTask(const Task&, std::string& message);

#endif  // INCLUDE_GRADEBOX_TASK_H_
