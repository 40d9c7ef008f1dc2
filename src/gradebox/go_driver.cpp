#include <gradebox/driver.h>

#include <cstdlib>

#include <spdlog/spdlog.h>
#include <gradebox/workspace.h>
#include "paths.h"

namespace {

const char kGoMod[] = "module task\n";

std::vector<std::string> GoEnv(const fs::path& workspace) {
  // no network, no toolchain download, go.mod may be updated in place
  std::vector<std::string> ret = {"GOFLAGS=-mod=mod", "GOPROXY=off", "GOTOOLCHAIN=local"};
  if (!getenv("HOME")) {
    ret.push_back("GOCACHE=" + GoCacheDir(workspace).string());
    ret.push_back("GOPATH=" + GoPathDir(workspace).string());
  }
  return ret;
}

} // namespace

std::vector<std::string> GoDriver::VersionCommand() const {
  return {binary_, "version"};
}

CompileRun GoDriver::Compile(const std::string& code, const Workspace& ws, long timeout_ms) {
  const fs::path& root = ws.Path();
  if (!CreateDirs(GoModuleDir(root)) || !WriteFile(GoModFile(root), kGoMod) ||
      !WriteFile(GoSourceFile(root), code)) {
    return PrepareFailure(GoModuleDir(root).string());
  }
  auto res = RunTool({binary_, "build", "-o", GoBuildOutput(root).string(), "main.go"},
                     GoModuleDir(root).string(), timeout_ms, GoEnv(root));
  return ParseCompileRun(std::move(res), "go build", timeout_ms);
}

TestRun GoDriver::RunTests(const std::string& code, const std::string& test_code,
                           const Workspace& ws, long timeout_ms) {
  const fs::path& root = ws.Path();
  // the module may not exist yet if Compile was skipped
  if (!CreateDirs(GoModuleDir(root)) || !WriteFile(GoModFile(root), kGoMod) ||
      !WriteFile(GoSourceFile(root), code) || !WriteFile(GoTestFile(root), test_code)) {
    TestRun ret;
    ret.tag = OutcomeTag::INTERNAL_ERROR;
    ret.errors.push_back("failed to prepare workspace");
    spdlog::error("Failed to write test sources into {}", GoModuleDir(root).c_str());
    return ret;
  }
  auto res = RunTool({binary_, "test", "-v", "-json"},
                     GoModuleDir(root).string(), timeout_ms, GoEnv(root));
  return ParseTestRun(std::move(res), "go test", timeout_ms);
}

DriverReport GoDriver::Verify(const std::string& code, const std::string& test_code,
                              const Workspace& ws, long timeout_ms) {
  BuildTestReport report;
  report.compile = Compile(code, ws, timeout_ms);
  if (!report.compile.compiled) return report;
  if (test_code.empty()) {
    spdlog::debug("No test source, skipping test phase");
    return report;
  }
  report.test = RunTests(code, test_code, ws, timeout_ms);
  return report;
}
