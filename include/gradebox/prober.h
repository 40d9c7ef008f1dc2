#ifndef INCLUDE_GRADEBOX_PROBER_H_
#define INCLUDE_GRADEBOX_PROBER_H_

#include <string>
#include <vector>

#include <gradebox/driver.h>

struct ToolchainStatus {
  Language lang;
  std::vector<std::string> command;
  bool available;
  std::string version; // first line of the version output
  std::string message; // why it is unavailable

  ToolchainStatus() : lang(Language::GO), available(false) {}
};

// Runs each driver's version command; never gates submission.
std::vector<ToolchainStatus> ProbeToolchains(const DriverRegistry&, long timeout_ms = kProbeTimeoutMs);
ToolchainStatus ProbeToolchain(const LanguageDriver&, long timeout_ms = kProbeTimeoutMs);

#endif  // INCLUDE_GRADEBOX_PROBER_H_
