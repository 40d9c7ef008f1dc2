#include <gradebox/prober.h>

#include <cstring>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "utils.h"

ToolchainStatus ProbeToolchain(const LanguageDriver& driver, long timeout_ms) {
  ToolchainStatus ret;
  ret.lang = driver.GetLanguage();
  ret.command = driver.VersionCommand();
  ProcessOptions opt;
  opt.argv = ret.command;
  opt.timeout_ms = timeout_ms;
  opt.max_output_bytes = 64 << 10;
  ProcessResult res = driver.Runner().Run(opt);
  if (!res.Started()) {
    ret.message = strerror(res.spawn_errno);
  } else if (res.timed_out) {
    ret.message = fmt::format("timed out after {} ms", timeout_ms);
  } else if (res.exit_code != 0) {
    ret.message = fmt::format("exited with status {}", res.exit_code);
  } else {
    ret.available = true;
    auto lines = NonEmptyLines(res.stdout_data);
    if (lines.empty()) lines = NonEmptyLines(res.stderr_data);
    // solc prints a banner before the version line
    for (auto& i : lines) {
      if (i.find("ersion") != std::string::npos) {
        ret.version = i;
        break;
      }
    }
    if (ret.version.empty() && !lines.empty()) ret.version = lines[0];
  }
  if (ret.available) {
    spdlog::info("Toolchain {} available: {}", LanguageName(ret.lang), ret.version);
  } else {
    spdlog::warn("Toolchain {} unavailable ({}): {}",
                 LanguageName(ret.lang), fmt::format("{}", fmt::join(ret.command, " ")), ret.message);
  }
  return ret;
}

std::vector<ToolchainStatus> ProbeToolchains(const DriverRegistry& drivers, long timeout_ms) {
  std::vector<ToolchainStatus> ret;
  for (auto driver : drivers.All()) ret.push_back(ProbeToolchain(*driver, timeout_ms));
  return ret;
}
