#include <gradebox/driver.h>

#include <spdlog/spdlog.h>
#include "utils.h"

std::string kGoBinary = "go";
std::string kSolcBinary = "solc";
long kDefaultTimeoutMs = 30000;
long kProbeTimeoutMs = 5000;
long kMaxOutputBytes = 4L << 20;

ProcessResult LanguageDriver::RunTool(std::vector<std::string>&& argv, const std::string& workdir,
                                      long timeout_ms, std::vector<std::string>&& envs) {
  ProcessOptions opt;
  opt.argv = std::move(argv);
  opt.workdir = workdir;
  opt.timeout_ms = timeout_ms;
  opt.envs = std::move(envs);
  opt.max_output_bytes = kMaxOutputBytes;
  return runner_.Run(opt);
}

CompileRun LanguageDriver::PrepareFailure(const std::string& what) {
  CompileRun ret;
  ret.tag = OutcomeTag::INTERNAL_ERROR;
  ret.errors.push_back("failed to prepare workspace");
  spdlog::error("Failed to prepare workspace: {}", what);
  return ret;
}

TestRun LanguageDriver::RunTests(const std::string&, const std::string&, const Workspace&, long) {
  TestRun ret;
  ret.tag = OutcomeTag::INTERNAL_ERROR;
  ret.errors.push_back(fmt::format("{} driver does not run tests", LanguageName(GetLanguage())));
  return ret;
}

void DriverRegistry::Register(std::unique_ptr<LanguageDriver>&& driver) {
  Language lang = driver->GetLanguage();
  spdlog::debug("Register driver for {}", LanguageName(lang));
  drivers_[lang] = std::move(driver);
}

LanguageDriver* DriverRegistry::Find(Language lang) const {
  auto it = drivers_.find(lang);
  if (it == drivers_.end()) return nullptr;
  return it->second.get();
}

std::vector<LanguageDriver*> DriverRegistry::All() const {
  std::vector<LanguageDriver*> ret;
  for (auto& i : drivers_) ret.push_back(i.second.get());
  return ret;
}

DriverRegistry DefaultDrivers(ProcessRunner& runner) {
  DriverRegistry ret;
  ret.Register(std::make_unique<GoDriver>(runner));
  ret.Register(std::make_unique<SolidityDriver>(runner));
  return ret;
}
