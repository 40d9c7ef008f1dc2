#ifndef INCLUDE_GRADEBOX_DRIVER_H_
#define INCLUDE_GRADEBOX_DRIVER_H_

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <utility>

#include <gradebox/task.h>
#include <gradebox/process.h>
#include <gradebox/result_parser.h>

extern std::string kGoBinary;
extern std::string kSolcBinary;
extern long kDefaultTimeoutMs;
extern long kProbeTimeoutMs;
extern long kMaxOutputBytes; // per captured stream

class Workspace;

class LanguageDriver {
 protected:
  ProcessRunner& runner_;

  ProcessResult RunTool(std::vector<std::string>&& argv, const std::string& workdir,
                        long timeout_ms, std::vector<std::string>&& envs = {});
  // compile record for a workspace that could not be populated
  static CompileRun PrepareFailure(const std::string& what);

 public:
  explicit LanguageDriver(ProcessRunner& runner) : runner_(runner) {}
  virtual ~LanguageDriver() = default;

  virtual Language GetLanguage() const = 0;
  virtual bool SupportsTests() const = 0;
  // command printing the toolchain version; used for health probing
  virtual std::vector<std::string> VersionCommand() const = 0;
  virtual CompileRun Compile(const std::string& code, const Workspace&, long timeout_ms) = 0;
  // only meaningful if SupportsTests()
  virtual TestRun RunTests(const std::string& code, const std::string& test_code,
                           const Workspace&, long timeout_ms);
  // compile, then run tests if compiled and test_code is non-empty
  virtual DriverReport Verify(const std::string& code, const std::string& test_code,
                              const Workspace&, long timeout_ms) = 0;

  ProcessRunner& Runner() const { return runner_; }
};

// Build-and-test driver for Go modules
class GoDriver : public LanguageDriver {
  std::string binary_;
 public:
  explicit GoDriver(ProcessRunner& runner, std::string binary = kGoBinary) :
      LanguageDriver(runner), binary_(std::move(binary)) {}

  Language GetLanguage() const override { return Language::GO; }
  bool SupportsTests() const override { return true; }
  std::vector<std::string> VersionCommand() const override;
  CompileRun Compile(const std::string& code, const Workspace&, long timeout_ms) override;
  TestRun RunTests(const std::string& code, const std::string& test_code,
                   const Workspace&, long timeout_ms) override;
  DriverReport Verify(const std::string& code, const std::string& test_code,
                      const Workspace&, long timeout_ms) override;
};

// Compile-only driver for Solidity contracts
class SolidityDriver : public LanguageDriver {
  std::string binary_;
 public:
  explicit SolidityDriver(ProcessRunner& runner, std::string binary = kSolcBinary) :
      LanguageDriver(runner), binary_(std::move(binary)) {}

  Language GetLanguage() const override { return Language::SOLIDITY; }
  bool SupportsTests() const override { return false; }
  std::vector<std::string> VersionCommand() const override;
  CompileRun Compile(const std::string& code, const Workspace&, long timeout_ms) override;
  DriverReport Verify(const std::string& code, const std::string& test_code,
                      const Workspace&, long timeout_ms) override;
};

class DriverRegistry {
  std::map<Language, std::unique_ptr<LanguageDriver>> drivers_;
 public:
  void Register(std::unique_ptr<LanguageDriver>&&);
  // nullptr if no driver handles the language
  LanguageDriver* Find(Language) const;
  std::vector<LanguageDriver*> All() const;
};

// Go and Solidity drivers sharing one runner
DriverRegistry DefaultDrivers(ProcessRunner&);

#endif  // INCLUDE_GRADEBOX_DRIVER_H_
