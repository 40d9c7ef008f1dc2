#include <gradebox/store.h>

#include <spdlog/spdlog.h>
#include "utils.h"

int64_t NextTimestamp(int64_t last) {
  int64_t now = NowMicros();
  return now > last ? now : last + 1;
}

Submission MemorySubmissionStore::Create(Submission&& sub) {
  std::lock_guard<std::mutex> lck(mtx_);
  sub.id = next_id_++;
  sub.created_at = last_timestamp_ = NextTimestamp(last_timestamp_);
  records_.push_back(std::move(sub));
  spdlog::debug("Stored submission {} for task {}", records_.back().id, records_.back().task_id);
  return records_.back();
}

long MemorySubmissionStore::CountByTask(long task_id) {
  std::lock_guard<std::mutex> lck(mtx_);
  long ret = 0;
  for (auto& i : records_) ret += i.task_id == task_id;
  return ret;
}

std::vector<Submission> MemorySubmissionStore::ListByTask(long task_id, size_t limit) {
  std::lock_guard<std::mutex> lck(mtx_);
  std::vector<Submission> ret;
  // records are appended in creation order
  for (auto it = records_.rbegin(); it != records_.rend(); ++it) {
    if (it->task_id != task_id) continue;
    ret.push_back(*it);
    if (limit && ret.size() == limit) break;
  }
  return ret;
}
