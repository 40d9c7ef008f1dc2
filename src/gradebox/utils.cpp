#include "utils.h"

#include <fcntl.h>
#include <dirent.h>
#include <unistd.h>
#include <sys/syscall.h>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <fstream>

#include <spdlog/spdlog.h>

namespace {

std::atomic_long workspace_id_seq = 0;

} // namespace

int CloseFrom(int minfd) {
#ifdef SYS_close_range
  if (syscall(SYS_close_range, minfd, ~0U, 0) == 0) return 0;
#endif
  // kernels before 5.9: walk the fd table
  DIR* dir = opendir("/proc/self/fd");
  if (!dir) return -1;
  int ret = 0, self = dirfd(dir);
  while (struct dirent* ent = readdir(dir)) {
    if (ent->d_name[0] < '0' || ent->d_name[0] > '9') continue;
    int fd = atoi(ent->d_name);
    if (fd >= minfd && fd != self && close(fd) < 0 && errno != EBADF) ret = -1;
  }
  closedir(dir);
  return ret;
}

long GetUniqueWorkspaceId() {
  return ++workspace_id_seq;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG2(TaskKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* TaskKindName, TaskKind, ENUM_TASK_KIND_)
#undef X

#define X(...) X_RETURN_ARG2(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageName, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG2(OutcomeTag, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* OutcomeTagName, OutcomeTag, ENUM_OUTCOME_TAG_)
#undef X

#define X(...) X_RETURN_ARG2(ResponseError, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ResponseErrorName, ResponseError, ENUM_RESPONSE_ERROR_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG2

static const char* kTaskKindNameTable[] = {
#define X(name, str) str,
  ENUM_TASK_KIND_
#undef X
};

static const char* kLanguageNameTable[] = {
#define X(name, str) str,
  ENUM_LANGUAGE_
#undef X
};

std::optional<TaskKind> GetTaskKind(const std::string& str) {
  for (size_t i = 0; i < sizeof(kTaskKindNameTable) / sizeof(kTaskKindNameTable[0]); i++) {
    if (str == kTaskKindNameTable[i]) return (TaskKind)i;
  }
  return std::nullopt;
}

std::optional<Language> GetLanguage(const std::string& str) {
  for (size_t i = 0; i < sizeof(kLanguageNameTable) / sizeof(kLanguageNameTable[0]); i++) {
    if (str == kLanguageNameTable[i]) return (Language)i;
  }
  return std::nullopt;
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
  return false;
}

bool WriteFile(const fs::path& path, const std::string& content) {
  spdlog::debug("Write {} bytes to {}", content.size(), path.c_str());
  std::ofstream fout(path, std::ios::binary | std::ios::trunc);
  if (fout) fout.write(content.data(), content.size());
  if (!fout) {
    spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
    return false;
  }
  return true;
}

std::string Trim(const std::string& str) {
  const char* kSpaces = " \t\r\n\v\f";
  size_t first = str.find_first_not_of(kSpaces);
  if (first == std::string::npos) return "";
  return str.substr(first, str.find_last_not_of(kSpaces) - first + 1);
}

int64_t NowMicros() {
  auto dur = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration_cast<std::chrono::microseconds>(dur).count();
}
