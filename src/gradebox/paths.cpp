#include "paths.h"

fs::path kWorkspaceRoot = "/tmp/gradebox_ws";
fs::path kDatabasePath = "/var/lib/gradebox/submissions.sqlite";
fs::path kConfigPath = "/etc/gradebox.conf";

namespace {

inline std::string PadInt(long x, size_t width) {
  std::string ret = std::to_string(x);
  if (ret.size() < width) ret = std::string(width - ret.size(), '0') + ret;
  return ret;
}

} // namespace

fs::path WorkspaceDirTemplate(const fs::path& root, long id) {
  return root / (PadInt(id, 6) + "_XXXXXX");
}

fs::path GoModuleDir(const fs::path& workspace) {
  return workspace / "task";
}
fs::path GoModFile(const fs::path& workspace) {
  return GoModuleDir(workspace) / "go.mod";
}
fs::path GoSourceFile(const fs::path& workspace) {
  return GoModuleDir(workspace) / "main.go";
}
fs::path GoTestFile(const fs::path& workspace) {
  return GoModuleDir(workspace) / "main_test.go";
}
fs::path GoBuildOutput(const fs::path& workspace) {
  return GoModuleDir(workspace) / "task";
}
fs::path GoCacheDir(const fs::path& workspace) {
  return workspace / "gocache";
}
fs::path GoPathDir(const fs::path& workspace) {
  return workspace / "gopath";
}

fs::path SolidityContractFile(const fs::path& workspace) {
  return workspace / "contract.sol";
}
