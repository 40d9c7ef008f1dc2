#ifndef INCLUDE_GRADEBOX_WORKSPACE_H_
#define INCLUDE_GRADEBOX_WORKSPACE_H_

#include <memory>
#include <filesystem>

// A fresh, uniquely named directory owned by one verification call.
// Removed recursively on Release() or destruction.
class Workspace {
  std::filesystem::path path_;

  explicit Workspace(std::filesystem::path path) : path_(std::move(path)) {}
 public:
  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;
  ~Workspace() { Release(); }

  // nullptr if the directory cannot be created
  static std::unique_ptr<Workspace> Acquire(const std::filesystem::path& root);

  const std::filesystem::path& Path() const { return path_; }
  bool Released() const { return path_.empty(); }
  bool Release();
};

#endif  // INCLUDE_GRADEBOX_WORKSPACE_H_
