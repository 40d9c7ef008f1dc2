#include <gtest/gtest.h>
#include <gradebox/json.h>
#include <gradebox/grader.h>

#include "utils.h"

using nlohmann::json;

TEST(ParseTaskTest, WriteTask) {
  json data{
      {"id", 12},
      {"kind", "write"},
      {"language", "go"},
      {"title", "Sum"},
      {"starter_code", "package main"},
      {"test_code", "package main\nimport \"testing\""},
      {"hints", json::array({"first", "second"})},
      {"tags", json::array({"basics"})},
      {"estimated_minutes", 15}};
  Task task;
  std::string message;
  ASSERT_TRUE(ParseTask(data, task, message)) << message;
  EXPECT_EQ(task.id, 12);
  EXPECT_EQ(task.kind, TaskKind::WRITE);
  EXPECT_EQ(task.lang, Language::GO);
  EXPECT_EQ(task.hints.size(), 2u);
  EXPECT_EQ(task.estimated_minutes, 15);
  EXPECT_TRUE(task.solution_code.empty());
}

TEST(ParseTaskTest, Rejected) {
  Task task;
  std::string message;
  // review task without sample code
  EXPECT_FALSE(ParseTask(json{{"id", 1}, {"kind", "review"}, {"language", "solidity"}}, task, message));
  EXPECT_FALSE(message.empty());
  // write task carrying review fields
  EXPECT_FALSE(ParseTask(json{{"id", 1}, {"kind", "write"}, {"language", "go"},
                              {"starter_code", "x"}, {"expected_issues", json::array({"a"})}}, task, message));
  EXPECT_FALSE(ParseTask(json{{"id", 1}, {"kind", "write"}, {"language", "rust"},
                              {"starter_code", "x"}}, task, message));
  EXPECT_EQ(message, "unknown language rust");
  EXPECT_FALSE(ParseTask(json{{"id", "one"}, {"kind", "write"}, {"language", "go"}}, task, message));
  EXPECT_FALSE(ParseTask(json::array(), task, message));
}

TEST(ParseRequestTest, Fields) {
  SubmissionRequest req;
  std::string message;
  ASSERT_TRUE(ParseRequest(json{{"task_id", 4}, {"found_issues", json::array({"a", "b"})},
                                {"review_answers", {{"q1", "answer"}}}, {"user_code", nullptr},
                                {"time_spent", 90}}, req, message));
  EXPECT_EQ(req.task_id, 4);
  EXPECT_FALSE(req.user_code);
  EXPECT_FALSE(req.improved_code);
  EXPECT_EQ(req.found_issues.size(), 2u);
  EXPECT_EQ(req.review_answers.at("q1"), "answer");
  EXPECT_EQ(req.time_spent, 90);

  EXPECT_FALSE(ParseRequest(json{{"user_code", "x"}}, req, message));
  EXPECT_FALSE(ParseRequest(json{{"task_id", 1}, {"found_issues", "a"}}, req, message));
}

TEST(ResponseJSONTest, Write) {
  GradeResponse res;
  res.kind = TaskKind::WRITE;
  res.submission_id = 3;
  res.attempts = 2;
  res.compilation.compiled = false;
  res.compilation.tag = OutcomeTag::COMPILE_ERROR;
  res.compilation.errors = {"main.go:1: bad"};
  res.hints = {"first"};
  json data = ResponseJSON(res);
  EXPECT_EQ(data["success"], false);
  EXPECT_EQ(data["submission_id"], 3);
  EXPECT_EQ(data["attempts"], 2);
  EXPECT_EQ(data["compilation"]["compiled"], false);
  EXPECT_EQ(data["compilation"]["errors"][0], "main.go:1: bad");
  EXPECT_EQ(data["hints"].size(), 1u);
  EXPECT_FALSE(data.contains("test_results"));

  res.hints.clear();
  res.compilation.tests.emplace();
  EXPECT_FALSE(ResponseJSON(res).contains("hints"));
  EXPECT_TRUE(ResponseJSON(res).contains("test_results"));
}

TEST(ResponseJSONTest, ReviewAndError) {
  GradeResponse res;
  res.kind = TaskKind::REVIEW;
  res.success = true;
  res.review = ScoreReview({"a", "b"}, {"a", "b"});
  json data = ResponseJSON(res);
  EXPECT_DOUBLE_EQ(data["score"].get<double>(), 100.0);
  EXPECT_EQ(data["feedback"], "Excellent! You found all the issues.");
  EXPECT_EQ(data["matched_issues"].size(), 2u);
  EXPECT_FALSE(data.contains("compilation"));

  res.error = ResponseError::VALIDATION;
  res.error_message = "missing user_code";
  data = ResponseJSON(res);
  EXPECT_EQ(data["success"], false);
  EXPECT_EQ(data["error"], "validation_error");
  EXPECT_EQ(data["message"], "missing user_code");
}

TEST(SubmissionJSONTest, EmbedsResult) {
  Submission sub;
  sub.id = 1;
  sub.result = OutcomeJSON(Outcome()).dump();
  json data = SubmissionJSON(sub);
  EXPECT_EQ(data["result"]["tag"], "ok");
  sub.result = "not json";
  EXPECT_EQ(SubmissionJSON(sub)["result"], "not json");
}
