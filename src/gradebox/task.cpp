#include <gradebox/task.h>

bool ValidateTask(const Task& task, std::string& message) {
  if (task.kind == TaskKind::WRITE) {
    if (!task.sample_code.empty() || !task.expected_issues.empty()) {
      message = "write task must not carry sample_code or expected_issues";
      return false;
    }
    if (task.starter_code.empty() && task.test_code.empty()) {
      message = "write task needs starter_code or test_code";
      return false;
    }
    return true;
  }
  if (task.sample_code.empty()) {
    message = "review task needs sample_code";
    return false;
  }
  if (!task.test_code.empty() || !task.starter_code.empty()) {
    message = "review task must not carry starter_code or test_code";
    return false;
  }
  return true;
}
