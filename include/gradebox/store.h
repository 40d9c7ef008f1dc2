#ifndef INCLUDE_GRADEBOX_STORE_H_
#define INCLUDE_GRADEBOX_STORE_H_

#include <mutex>
#include <vector>

#include <gradebox/submission.h>

// Persistence collaborator. Implementations must be safe to call from
// concurrent graders.
class SubmissionStore {
 public:
  virtual ~SubmissionStore() = default;
  // assigns id and created_at; returns the stored record
  virtual Submission Create(Submission&&) = 0;
  virtual long CountByTask(long task_id) = 0;
  // newest first; limit = 0 for all
  virtual std::vector<Submission> ListByTask(long task_id, size_t limit) = 0;
};

class MemorySubmissionStore : public SubmissionStore {
  std::mutex mtx_;
  std::vector<Submission> records_;
  long next_id_;
  int64_t last_timestamp_;
 public:
  MemorySubmissionStore() : next_id_(1), last_timestamp_(0) {}

  Submission Create(Submission&&) override;
  long CountByTask(long task_id) override;
  std::vector<Submission> ListByTask(long task_id, size_t limit) override;
};

// microseconds since epoch; never returns a value <= last
int64_t NextTimestamp(int64_t last);

#endif  // INCLUDE_GRADEBOX_STORE_H_
