#ifndef GRADEBOX_PATHS_H_
#define GRADEBOX_PATHS_H_

#include <gradebox/paths.h>

#include "utils.h"

// workspace layout
fs::path WorkspaceDirTemplate(const fs::path& root, long id);
fs::path GoModuleDir(const fs::path& workspace);
fs::path GoModFile(const fs::path& workspace);
fs::path GoSourceFile(const fs::path& workspace);
fs::path GoTestFile(const fs::path& workspace);
fs::path GoBuildOutput(const fs::path& workspace);
fs::path GoCacheDir(const fs::path& workspace);
fs::path GoPathDir(const fs::path& workspace);
fs::path SolidityContractFile(const fs::path& workspace);

#endif  // GRADEBOX_PATHS_H_
