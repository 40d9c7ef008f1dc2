#include "database.h"

#include <spdlog/spdlog.h>

namespace {

Submission FromRow(SubmissionRow&& row) {
  Submission ret;
  ret.id = row.id;
  ret.task_id = row.task_id;
  ret.kind = (TaskKind)row.kind;
  ret.code = std::move(row.code);
  ret.result = std::move(row.result);
  ret.passed = row.passed;
  ret.attempt = row.attempt;
  ret.time_spent = row.time_spent;
  ret.created_at = row.created_at;
  return ret;
}

} // namespace

void Database::Init() {
  if (db_) return;
  if (path_.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(path_.parent_path(), ec);
    if (ec) spdlog::warn("Failed creating {}: {}", path_.parent_path().c_str(), ec.message());
  }
  spdlog::debug("Open database {}", path_.c_str());
  db_ = std::make_unique<Storage>(InitStorage(path_.string()));
  if (auto last = db_->max(&SubmissionRow::created_at)) last_timestamp_ = *last;
}

Submission Database::Create(Submission&& sub) {
  std::lock_guard lck(mtx_);
  Init();
  sub.created_at = last_timestamp_ = NextTimestamp(last_timestamp_);
  SubmissionRow row{0, sub.task_id, (int)sub.kind, std::move(sub.code), std::move(sub.result),
                    sub.passed, sub.attempt, sub.time_spent, sub.created_at};
  row.id = db_->insert(row);
  spdlog::debug("Stored submission {} for task {}", row.id, row.task_id);
  return FromRow(std::move(row));
}

long Database::CountByTask(long task_id) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  Init();
  return db_->count<SubmissionRow>(where(c(&SubmissionRow::task_id) == task_id));
}

std::vector<Submission> Database::ListByTask(long task_id, size_t limit) {
  using namespace sqlite_orm;
  std::lock_guard lck(mtx_);
  Init();
  std::vector<SubmissionRow> rows;
  if (limit) {
    rows = db_->get_all<SubmissionRow>(where(c(&SubmissionRow::task_id) == task_id),
                                       multi_order_by(order_by(&SubmissionRow::created_at).desc(),
                                                      order_by(&SubmissionRow::id).desc()),
                                       sqlite_orm::limit((int)limit));
  } else {
    rows = db_->get_all<SubmissionRow>(where(c(&SubmissionRow::task_id) == task_id),
                                       multi_order_by(order_by(&SubmissionRow::created_at).desc(),
                                                      order_by(&SubmissionRow::id).desc()));
  }
  std::vector<Submission> ret;
  for (auto& i : rows) ret.push_back(FromRow(std::move(i)));
  return ret;
}
