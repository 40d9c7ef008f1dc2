#ifndef INCLUDE_GRADEBOX_PATHS_H_
#define INCLUDE_GRADEBOX_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

extern fs::path kWorkspaceRoot;
extern fs::path kDatabasePath;
extern fs::path kConfigPath;

#endif  // INCLUDE_GRADEBOX_PATHS_H_
