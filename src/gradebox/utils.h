#ifndef GRADEBOX_UTILS_H_
#define GRADEBOX_UTILS_H_

#include <string>
#include <filesystem>

#include <gradebox/utils.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

// close every fd >= minfd; async-signal-safe enough for use after fork()
int CloseFrom(int minfd);

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content);

// strips leading and trailing whitespace
std::string Trim(const std::string&);

int64_t NowMicros();

#endif  // GRADEBOX_UTILS_H_
