#include <gradebox/workspace.h>

#include <cstdlib>
#include <cstring>

#include <spdlog/spdlog.h>
#include "paths.h"

std::unique_ptr<Workspace> Workspace::Acquire(const fs::path& root) {
  if (!CreateDirs(root)) return nullptr;
  std::string tmpl = WorkspaceDirTemplate(root, GetUniqueWorkspaceId());
  if (!mkdtemp(tmpl.data())) {
    spdlog::error("Failed creating workspace under {}: {}", root.c_str(), strerror(errno));
    return nullptr;
  }
  spdlog::debug("Workspace acquired: {}", tmpl);
  return std::unique_ptr<Workspace>(new Workspace(fs::path(tmpl)));
}

bool Workspace::Release() {
  if (path_.empty()) return true;
  bool ret = RemoveAll(path_);
  if (ret) spdlog::debug("Workspace released: {}", path_.c_str());
  path_.clear();
  return ret;
}
