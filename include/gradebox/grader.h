#ifndef INCLUDE_GRADEBOX_GRADER_H_
#define INCLUDE_GRADEBOX_GRADER_H_

#include <array>
#include <mutex>
#include <filesystem>

#include <gradebox/task.h>
#include <gradebox/store.h>
#include <gradebox/driver.h>
#include <gradebox/submission.h>

// Serializes count-then-create per task. Task ids hash onto a fixed set of
// mutexes, so memory stays bounded; tasks sharing a stripe only wait on each other.
class TaskLock {
  static constexpr size_t kStripes = 64;
  std::array<std::mutex, kStripes> stripes_;
 public:
  std::mutex& operator[](long task_id);
};

// Orchestrates one verification call: validate, execute (write) or
// score (review), derive the verdict, persist exactly one Submission.
// Holds no per-call state; safe to share between threads.
class Grader {
  const DriverRegistry& drivers_;
  SubmissionStore& store_;
  std::filesystem::path workspace_root_;
  long timeout_ms_;
  TaskLock task_lock_;

  GradeResponse GradeWrite(const Task&, const SubmissionRequest&);
  GradeResponse GradeReview(const Task&, const SubmissionRequest&);
  // count prior submissions and create the record under the task lock
  Submission Persist(Submission&&);

 public:
  Grader(const DriverRegistry& drivers, SubmissionStore& store,
         std::filesystem::path workspace_root, long timeout_ms = kDefaultTimeoutMs) :
      drivers_(drivers), store_(store),
      workspace_root_(std::move(workspace_root)), timeout_ms_(timeout_ms) {}

  GradeResponse Submit(const Task&, const SubmissionRequest&);

  // runs code against the task's tests in a fresh workspace; nothing is persisted
  Outcome VerifyCode(const Task&, const std::string& code);
  // self-check of the reference solution; INTERNAL_ERROR tag if the task has none
  Outcome CheckReference(const Task&);

  std::vector<Submission> TaskHistory(long task_id, size_t limit);
  TaskStats ComputeTaskStats(long task_id);
};

// write tasks: first (attempt - 1) hints on a failed retry, none otherwise
std::vector<std::string> HintsForAttempt(const Task&, int attempt, bool passed);

// set-based, case-sensitive matching of found vs expected issue labels
ReviewScore ScoreReview(const std::vector<std::string>& expected,
                        const std::vector<std::string>& found);

#endif  // INCLUDE_GRADEBOX_GRADER_H_
