#include <gradebox/grader.h>

#include <map>
#include <set>
#include <cmath>
#include <algorithm>
#include <functional>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <gradebox/json.h>
#include <gradebox/workspace.h>
#include "utils.h"

namespace {

GradeResponse ErrorResponse(ResponseError error, std::string message, TaskKind kind) {
  GradeResponse ret;
  ret.error = error;
  ret.error_message = std::move(message);
  ret.kind = kind;
  return ret;
}

Outcome FailedOutcome(OutcomeTag tag, std::string message) {
  Outcome ret;
  ret.tag = tag;
  ret.errors.push_back(std::move(message));
  return ret;
}

} // namespace

std::mutex& TaskLock::operator[](long task_id) {
  return stripes_[std::hash<long>()(task_id) % kStripes];
}

double ReviewScore::Percent() const {
  return std::round(ratio * 1000) / 10;
}

std::vector<std::string> HintsForAttempt(const Task& task, int attempt, bool passed) {
  if (passed || attempt < 2) return {};
  size_t count = std::min((size_t)attempt - 1, task.hints.size());
  return std::vector<std::string>(task.hints.begin(), task.hints.begin() + count);
}

ReviewScore ScoreReview(const std::vector<std::string>& expected,
                        const std::vector<std::string>& found) {
  ReviewScore ret;
  std::set<std::string> expected_set(expected.begin(), expected.end());
  std::set<std::string> found_set(found.begin(), found.end());
  for (auto& i : expected_set) {
    if (found_set.count(i)) {
      ret.matched_issues.push_back(i);
    } else {
      ret.missed_issues.push_back(i);
    }
  }
  ret.expected_issues = expected;
  ret.found_issues = found;
  if (!expected_set.empty()) ret.ratio = (double)ret.matched_issues.size() / expected_set.size();

  std::string missed = fmt::format("{}", fmt::join(ret.missed_issues, "; "));
  if (!expected_set.empty() && ret.missed_issues.empty()) {
    ret.feedback = "Excellent! You found all the issues.";
  } else if (ret.Passed()) {
    ret.feedback = "Good job! You found most of the issues. Missed: " + missed;
  } else if (!ret.missed_issues.empty()) {
    ret.feedback = "Keep practicing. Missed issues: " + missed;
  } else {
    ret.feedback = "Keep practicing.";
  }
  return ret;
}

Submission Grader::Persist(Submission&& sub) {
  std::lock_guard lck(task_lock_[sub.task_id]);
  sub.attempt = store_.CountByTask(sub.task_id) + 1;
  return store_.Create(std::move(sub));
}

Outcome Grader::VerifyCode(const Task& task, const std::string& code) {
  LanguageDriver* driver = drivers_.Find(task.lang);
  if (!driver) {
    spdlog::error("No driver registered for {}", LanguageName(task.lang));
    return FailedOutcome(OutcomeTag::TOOLCHAIN_UNAVAILABLE,
                         fmt::format("no toolchain configured for {}", LanguageName(task.lang)));
  }
  auto ws = Workspace::Acquire(workspace_root_);
  if (!ws) return FailedOutcome(OutcomeTag::INTERNAL_ERROR, "failed to create workspace");
  spdlog::debug("Verifying task {} in {}", task.id, ws->Path().c_str());
  Outcome ret = NormalizeReport(driver->Verify(code, task.test_code, *ws, timeout_ms_));
  ws->Release();
  return ret;
}

Outcome Grader::CheckReference(const Task& task) {
  if (task.solution_code.empty()) {
    return FailedOutcome(OutcomeTag::INTERNAL_ERROR, "task has no reference solution");
  }
  Outcome ret = VerifyCode(task, task.solution_code);
  if (!ret.Passed()) {
    spdlog::warn("Reference solution of task {} does not pass: {}", task.id, OutcomeTagName(ret.tag));
  }
  return ret;
}

GradeResponse Grader::GradeWrite(const Task& task, const SubmissionRequest& req) {
  if (!req.user_code || req.user_code->empty()) {
    return ErrorResponse(ResponseError::VALIDATION, "missing user_code", TaskKind::WRITE);
  }
  Outcome outcome = VerifyCode(task, *req.user_code);
  if (outcome.IsInfrastructureFailure()) {
    GradeResponse ret;
    if (outcome.tag == OutcomeTag::TOOLCHAIN_UNAVAILABLE) {
      ret = ErrorResponse(ResponseError::TOOLCHAIN_UNAVAILABLE,
                          outcome.errors.empty() ? "toolchain unavailable" : outcome.errors[0],
                          TaskKind::WRITE);
    } else {
      spdlog::error("Task {}: verification failed: {}", task.id, fmt::join(outcome.errors, "; "));
      ret = ErrorResponse(ResponseError::INTERNAL, "internal error", TaskKind::WRITE);
    }
    ret.compilation = std::move(outcome);
    return ret;
  }

  Submission sub;
  sub.task_id = task.id;
  sub.kind = TaskKind::WRITE;
  sub.code = *req.user_code;
  sub.result = OutcomeJSON(outcome).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  sub.passed = outcome.Passed();
  sub.time_spent = req.time_spent;
  Submission stored = Persist(std::move(sub));

  GradeResponse ret;
  ret.kind = TaskKind::WRITE;
  ret.success = stored.passed;
  ret.submission_id = stored.id;
  ret.attempts = stored.attempt;
  ret.hints = HintsForAttempt(task, stored.attempt, stored.passed);
  ret.compilation = std::move(outcome);
  spdlog::info("Task {} submission {}: attempt={} tag={} passed={}", task.id, stored.id,
               stored.attempt, OutcomeTagName(ret.compilation.tag), stored.passed);
  return ret;
}

GradeResponse Grader::GradeReview(const Task& task, const SubmissionRequest& req) {
  // blank issue lines and blank answers are not submitted
  std::vector<std::string> found;
  for (auto& i : req.found_issues) {
    std::string issue = Trim(i);
    if (issue.size()) found.push_back(std::move(issue));
  }
  std::map<std::string, std::string> answers;
  for (auto& i : req.review_answers) {
    if (Trim(i.second).size()) answers.insert(i);
  }
  if (answers.empty() && found.empty()) {
    return ErrorResponse(ResponseError::VALIDATION, "missing review_answers or found_issues",
                         TaskKind::REVIEW);
  }
  ReviewScore score = ScoreReview(task.expected_issues, found);

  nlohmann::json answer{
      {"found_issues", found},
      {"review_answers", answers},
      {"improved_code", nullptr}};
  if (req.improved_code) answer["improved_code"] = *req.improved_code;
  nlohmann::json result{
      {"score", score.ratio * 100}, // unrounded; responses round
      {"matched_issues", score.matched_issues},
      {"expected_issues", score.expected_issues},
      {"feedback", score.feedback}};

  Submission sub;
  sub.task_id = task.id;
  sub.kind = TaskKind::REVIEW;
  sub.code = answer.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  sub.result = result.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  sub.passed = score.Passed();
  sub.time_spent = req.time_spent;
  Submission stored = Persist(std::move(sub));

  GradeResponse ret;
  ret.kind = TaskKind::REVIEW;
  ret.success = stored.passed;
  ret.submission_id = stored.id;
  ret.attempts = stored.attempt;
  ret.review = std::move(score);
  spdlog::info("Task {} submission {}: attempt={} score={} passed={}", task.id, stored.id,
               stored.attempt, ret.review.Percent(), stored.passed);
  return ret;
}

GradeResponse Grader::Submit(const Task& task, const SubmissionRequest& req) {
  std::string message;
  if (req.task_id != task.id) {
    return ErrorResponse(ResponseError::VALIDATION,
                         fmt::format("task_id {} does not match task {}", req.task_id, task.id),
                         task.kind);
  }
  if (!ValidateTask(task, message)) {
    return ErrorResponse(ResponseError::VALIDATION, message, task.kind);
  }
  try {
    if (task.kind == TaskKind::WRITE) return GradeWrite(task, req);
    return GradeReview(task, req);
  } catch (std::exception& err) {
    spdlog::error("Task {}: grading failed: {}", task.id, err.what());
    return ErrorResponse(ResponseError::INTERNAL, "internal error", task.kind);
  }
}

std::vector<Submission> Grader::TaskHistory(long task_id, size_t limit) {
  return store_.ListByTask(task_id, limit);
}

TaskStats Grader::ComputeTaskStats(long task_id) {
  TaskStats ret;
  ret.task_id = task_id;
  auto subs = store_.ListByTask(task_id, 0);
  for (auto& i : subs) {
    ret.total_attempts++;
    ret.total_time_spent += i.time_spent;
    if (i.passed) {
      ret.passed_attempts++;
      if (!ret.first_passed_attempt || i.attempt < ret.first_passed_attempt) {
        ret.first_passed_attempt = i.attempt;
      }
    }
    if (i.kind != TaskKind::REVIEW) continue;
    nlohmann::json result = nlohmann::json::parse(i.result, nullptr, false);
    if (result.is_object()) {
      auto it = result.find("score");
      if (it != result.end() && it->is_number()) {
        ret.best_score = std::max(ret.best_score, it->get<double>());
      }
    }
  }
  return ret;
}
