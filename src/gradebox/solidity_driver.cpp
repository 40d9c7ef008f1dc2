#include <gradebox/driver.h>

#include <spdlog/spdlog.h>
#include <gradebox/workspace.h>
#include "paths.h"

std::vector<std::string> SolidityDriver::VersionCommand() const {
  return {binary_, "--version"};
}

CompileRun SolidityDriver::Compile(const std::string& code, const Workspace& ws, long timeout_ms) {
  const fs::path& root = ws.Path();
  fs::path contract = SolidityContractFile(root);
  if (!WriteFile(contract, code)) return PrepareFailure(contract.string());
  auto res = RunTool({binary_, "--abi", "--bin", "--optimize", contract.filename().string()},
                     root.string(), timeout_ms);
  return ParseCompileRun(std::move(res), "solc", timeout_ms);
}

DriverReport SolidityDriver::Verify(const std::string& code, const std::string& test_code,
                                    const Workspace& ws, long timeout_ms) {
  if (!test_code.empty()) {
    spdlog::warn("Solidity driver is compile-only; ignoring {} bytes of test source", test_code.size());
  }
  CompileOnlyReport report;
  report.compile = Compile(code, ws, timeout_ms);
  return report;
}
