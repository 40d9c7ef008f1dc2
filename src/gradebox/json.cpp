#include <gradebox/json.h>

#include <cmath>

#include <spdlog/spdlog.h>
#include "utils.h"

using nlohmann::json;

namespace {

json TestsJSON(const TestOutcome& tests) {
  return json{
      {"passed", tests.passed},
      {"exit_code", tests.exit_code},
      {"passed_tests", tests.passed_count},
      {"failed_tests", tests.failed_count},
      {"tally_consistent", tests.tally_consistent},
      {"output", tests.output},
      {"error_output", tests.error_output},
      {"events", tests.events}};
}

} // namespace

json OutcomeJSON(const Outcome& outcome) {
  json ret{
      {"tag", OutcomeTagName(outcome.tag)},
      {"compiled", outcome.compiled},
      {"errors", outcome.errors},
      {"output", outcome.output},
      {"elapsed_us", outcome.elapsed_us}};
  if (outcome.tests) ret["test_results"] = TestsJSON(*outcome.tests);
  return ret;
}

json ResponseJSON(const GradeResponse& res) {
  if (res.error != ResponseError::NONE) {
    json ret{
        {"success", false},
        {"error", ResponseErrorName(res.error)},
        {"message", res.error_message}};
    if (res.error == ResponseError::TOOLCHAIN_UNAVAILABLE) {
      ret["compilation"] = OutcomeJSON(res.compilation);
    }
    return ret;
  }
  json ret{
      {"success", res.success},
      {"submission_id", res.submission_id},
      {"kind", TaskKindName(res.kind)},
      {"attempts", res.attempts}};
  if (res.kind == TaskKind::WRITE) {
    ret["compilation"] = {
        {"tag", OutcomeTagName(res.compilation.tag)},
        {"compiled", res.compilation.compiled},
        {"errors", res.compilation.errors},
        {"output", res.compilation.output}};
    if (res.compilation.tests) ret["test_results"] = TestsJSON(*res.compilation.tests);
    if (!res.hints.empty()) ret["hints"] = res.hints;
  } else {
    ret["score"] = res.review.Percent();
    ret["matched_issues"] = res.review.matched_issues;
    ret["expected_issues"] = res.review.expected_issues;
    ret["found_issues"] = res.review.found_issues;
    ret["feedback"] = res.review.feedback;
  }
  return ret;
}

json SubmissionJSON(const Submission& sub) {
  json ret{
      {"id", sub.id},
      {"task_id", sub.task_id},
      {"kind", TaskKindName(sub.kind)},
      {"passed", sub.passed},
      {"attempt", sub.attempt},
      {"time_spent", sub.time_spent},
      {"created_at", sub.created_at},
      {"code", sub.code}};
  // stored payloads are our own JSON; keep them raw if not
  json result = json::parse(sub.result, nullptr, false);
  if (result.is_discarded()) {
    ret["result"] = sub.result;
  } else {
    ret["result"] = std::move(result);
  }
  return ret;
}

json ToolchainJSON(const ToolchainStatus& status) {
  json ret{
      {"language", LanguageName(status.lang)},
      {"command", status.command},
      {"available", status.available}};
  if (status.available) {
    ret["version"] = status.version;
  } else {
    ret["message"] = status.message;
  }
  return ret;
}

json StatsJSON(const TaskStats& stats) {
  json ret{
      {"task_id", stats.task_id},
      {"total_attempts", stats.total_attempts},
      {"passed_attempts", stats.passed_attempts},
      {"best_score", std::round(stats.best_score * 10) / 10},
      {"total_time_spent", stats.total_time_spent}};
  if (stats.first_passed_attempt) {
    ret["first_passed_attempt"] = stats.first_passed_attempt;
  } else {
    ret["first_passed_attempt"] = nullptr;
  }
  return ret;
}

bool ParseTask(const json& data, Task& task, std::string& message) {
  try {
    if (!data.is_object()) {
      message = "task must be a JSON object";
      return false;
    }
    task.id = data.at("id").get<long>();
    std::string kind = data.at("kind").get<std::string>();
    if (auto val = GetTaskKind(kind)) {
      task.kind = *val;
    } else {
      message = "unknown task kind " + kind;
      return false;
    }
    std::string lang = data.at("language").get<std::string>();
    if (auto val = GetLanguage(lang)) {
      task.lang = *val;
    } else {
      message = "unknown language " + lang;
      return false;
    }
    task.title = data.value("title", "");
    task.starter_code = data.value("starter_code", "");
    task.test_code = data.value("test_code", "");
    task.solution_code = data.value("solution_code", "");
    task.sample_code = data.value("sample_code", "");
    task.review_questions = data.value("review_questions", std::vector<std::string>());
    task.expected_issues = data.value("expected_issues", std::vector<std::string>());
    task.hints = data.value("hints", std::vector<std::string>());
    task.requirements = data.value("requirements", "");
    task.tags = data.value("tags", std::vector<std::string>());
    task.estimated_minutes = data.value("estimated_minutes", 0);
  } catch (json::exception& err) {
    spdlog::warn("Task parsing error: {}", err.what());
    message = err.what();
    return false;
  }
  return ValidateTask(task, message);
}

bool ParseRequest(const json& data, SubmissionRequest& req, std::string& message) {
  try {
    if (!data.is_object()) {
      message = "request must be a JSON object";
      return false;
    }
    req.task_id = data.at("task_id").get<long>();
    if (auto it = data.find("user_code"); it != data.end() && !it->is_null()) {
      req.user_code = it->get<std::string>();
    }
    if (auto it = data.find("review_answers"); it != data.end() && !it->is_null()) {
      req.review_answers = it->get<std::map<std::string, std::string>>();
    }
    if (auto it = data.find("found_issues"); it != data.end() && !it->is_null()) {
      req.found_issues = it->get<std::vector<std::string>>();
    }
    if (auto it = data.find("improved_code"); it != data.end() && !it->is_null()) {
      req.improved_code = it->get<std::string>();
    }
    req.time_spent = data.value("time_spent", 0L);
  } catch (json::exception& err) {
    spdlog::warn("Request parsing error: {}", err.what());
    message = err.what();
    return false;
  }
  return true;
}
