#ifndef INCLUDE_GRADEBOX_SUBMISSION_H_
#define INCLUDE_GRADEBOX_SUBMISSION_H_

#include <map>
#include <string>
#include <vector>
#include <cstdint>
#include <optional>

#include <gradebox/task.h>
#include <gradebox/outcome.h>

// Review tasks pass with score >= this ratio
constexpr double kReviewPassRatio = 0.60;

struct SubmissionRequest {
  long task_id;
  std::optional<std::string> user_code;
  std::map<std::string, std::string> review_answers;
  std::vector<std::string> found_issues;
  std::optional<std::string> improved_code;
  long time_spent; // seconds

  SubmissionRequest() : task_id(0), time_spent(0) {}
};

// Persisted record; immutable once created by a SubmissionStore
struct Submission {
  long id;
  long task_id;
  TaskKind kind;
  std::string code; // submitted code (write) or answer payload JSON (review)
  std::string result; // outcome JSON (write) or score payload JSON (review)
  bool passed;
  int attempt;
  long time_spent; // seconds
  int64_t created_at; // UNIX timestamp, microseconds

  Submission() :
      id(0), task_id(0), kind(TaskKind::WRITE), passed(false),
      attempt(0), time_spent(0), created_at(0) {}
};

#define ENUM_RESPONSE_ERROR_ \
  X(NONE, "") \
  X(VALIDATION, "validation_error") \
  X(TOOLCHAIN_UNAVAILABLE, "toolchain_unavailable") \
  X(INTERNAL, "internal_error")
enum class ResponseError {
#define X(name, str) name,
  ENUM_RESPONSE_ERROR_
#undef X
};

struct ReviewScore {
  double ratio; // 0..1
  std::vector<std::string> matched_issues, expected_issues, found_issues;
  std::vector<std::string> missed_issues;
  std::string feedback;

  ReviewScore() : ratio(0) {}
  double Percent() const; // rounded to one decimal
  bool Passed() const { return ratio >= kReviewPassRatio; }
};

struct GradeResponse {
  ResponseError error;
  std::string error_message;
  bool success;
  long submission_id;
  TaskKind kind;
  int attempts;
  // write
  Outcome compilation;
  std::vector<std::string> hints;
  // review
  ReviewScore review;

  GradeResponse() :
      error(ResponseError::NONE), success(false), submission_id(0),
      kind(TaskKind::WRITE), attempts(0) {}
};

struct TaskStats {
  long task_id;
  int total_attempts;
  int passed_attempts;
  int first_passed_attempt; // 0 if never passed
  double best_score; // review tasks, percent
  long total_time_spent;

  TaskStats() :
      task_id(0), total_attempts(0), passed_attempts(0),
      first_passed_attempt(0), best_score(0), total_time_spent(0) {}
};

#endif  // INCLUDE_GRADEBOX_SUBMISSION_H_
