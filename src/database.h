#ifndef DATABASE_H_
#define DATABASE_H_

#include <mutex>
#include <memory>

#include <sqlite_orm/sqlite_orm.h>
#include <gradebox/store.h>
#include <gradebox/paths.h>

// flat row of a Submission; kind is stored as its enum value
struct SubmissionRow {
  long id;
  long task_id;
  int kind;
  std::string code;
  std::string result;
  bool passed;
  int attempt;
  long time_spent;
  int64_t created_at;
};

namespace {

inline auto InitStorage(const std::string& path) {
  using namespace sqlite_orm;
  auto storage = make_storage(path,
      make_index("idx_submissions_task_created", &SubmissionRow::task_id, &SubmissionRow::created_at),
      make_table("submissions",
                 make_column("id", &SubmissionRow::id, primary_key().autoincrement()),
                 make_column("task_id", &SubmissionRow::task_id),
                 make_column("kind", &SubmissionRow::kind),
                 make_column("code", &SubmissionRow::code),
                 make_column("result", &SubmissionRow::result),
                 make_column("passed", &SubmissionRow::passed, default_value(false)),
                 make_column("attempt", &SubmissionRow::attempt),
                 make_column("time_spent", &SubmissionRow::time_spent, default_value(0)),
                 make_column("created_at", &SubmissionRow::created_at)));
  storage.sync_schema(true);
  return storage;
}

} // namespace

// SQLite-backed store; storage errors surface as std::system_error
class Database : public SubmissionStore {
 public:
  using Storage = decltype(InitStorage(""));

 private:
  fs::path path_;
  std::mutex mtx_;
  std::unique_ptr<Storage> db_;
  int64_t last_timestamp_;

  void Init();

 public:
  explicit Database(fs::path path = kDatabasePath) : path_(std::move(path)), last_timestamp_(0) {}

  Submission Create(Submission&&) override;
  long CountByTask(long task_id) override;
  std::vector<Submission> ListByTask(long task_id, size_t limit) override;
};

#endif  // DATABASE_H_
