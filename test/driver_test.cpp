#include <algorithm>

#include <gtest/gtest.h>
#include <gradebox/paths.h>
#include <gradebox/driver.h>
#include <gradebox/workspace.h>

#include "utils.h"

namespace {

const char kGoSum[] = R"(package main

func Sum(a, b int) int {
	return a + b
}

func main() {}
)";

const char kGoSumTest[] = R"(package main

import "testing"

func TestSum(t *testing.T) {
	if Sum(1, 2) != 3 {
		t.Fatal("wrong")
	}
}

func TestSumZero(t *testing.T) {
	if Sum(0, 0) != 0 {
		t.Fatal("wrong")
	}
}
)";

const char kContract[] = R"(// SPDX-License-Identifier: MIT
pragma solidity >=0.8.0;

contract Counter {
    uint256 public count;
    function increment() public { count += 1; }
}
)";

bool HasEnv(const ProcessOptions& opt, const std::string& env) {
  return std::find(opt.envs.begin(), opt.envs.end(), env) != opt.envs.end();
}

bool ToolInstalled(const std::string& name) {
  int err;
  return !ResolveExecutable(name, err).empty();
}

} // namespace

class DriverTest : public ::testing::Test {
 protected:
  FakeProcessRunner runner;
  std::unique_ptr<Workspace> ws;

  void SetUp() override {
    ws = Workspace::Acquire(kWorkspaceRoot);
    ASSERT_TRUE(ws);
  }
};

TEST_F(DriverTest, GoBuildWritesModule) {
  GoDriver driver(runner, "go");
  DriverReport report = driver.Verify(kGoSum, "", *ws, 5000);
  ASSERT_TRUE(std::holds_alternative<BuildTestReport>(report));
  auto& build = std::get<BuildTestReport>(report);
  EXPECT_TRUE(build.compile.compiled);
  EXPECT_FALSE(build.test);

  ASSERT_EQ(runner.calls.size(), 1u);
  auto& call = runner.calls[0];
  fs::path module = ws->Path() / "task";
  EXPECT_EQ(call.options.argv,
            (std::vector<std::string>{"go", "build", "-o", (module / "task").string(), "main.go"}));
  EXPECT_EQ(call.options.workdir, module.string());
  EXPECT_EQ(call.options.timeout_ms, 5000);
  EXPECT_EQ(call.files["go.mod"], "module task\n");
  EXPECT_EQ(call.files["main.go"], kGoSum);
  EXPECT_EQ(call.files.count("main_test.go"), 0u);
  EXPECT_TRUE(HasEnv(call.options, "GOPROXY=off"));
  EXPECT_TRUE(HasEnv(call.options, "GOFLAGS=-mod=mod"));
  EXPECT_TRUE(HasEnv(call.options, "GOTOOLCHAIN=local"));
}

TEST_F(DriverTest, GoRunsTestsAfterBuild) {
  runner.results = {
    FakeProcessRunner::Exit(0),
    FakeProcessRunner::Exit(0, GoTestEvent("pass", "TestSum") + GoTestEvent("pass", "TestSumZero") +
                               GoTestEvent("pass"))};
  GoDriver driver(runner, "go");
  auto report = std::get<BuildTestReport>(driver.Verify(kGoSum, kGoSumTest, *ws, 5000));
  ASSERT_TRUE(report.test);
  EXPECT_TRUE(report.test->outcome.passed);
  EXPECT_EQ(report.test->outcome.passed_count, 3);

  ASSERT_EQ(runner.calls.size(), 2u);
  EXPECT_EQ(runner.calls[1].options.argv, (std::vector<std::string>{"go", "test", "-v", "-json"}));
  EXPECT_EQ(runner.calls[1].files["main_test.go"], kGoSumTest);
  EXPECT_EQ(runner.calls[1].files["main.go"], kGoSum);
}

TEST_F(DriverTest, GoSkipsTestsOnBuildFailure) {
  runner.results = {FakeProcessRunner::Exit(1, "", "./main.go:1:1: expected 'package'\n")};
  GoDriver driver(runner, "go");
  auto report = std::get<BuildTestReport>(driver.Verify("garbage", kGoSumTest, *ws, 5000));
  EXPECT_FALSE(report.compile.compiled);
  EXPECT_EQ(report.compile.tag, OutcomeTag::COMPILE_ERROR);
  EXPECT_FALSE(report.test);
  EXPECT_EQ(runner.calls.size(), 1u);
}

TEST_F(DriverTest, GoMissingToolchain) {
  runner.results = {FakeProcessRunner::Missing()};
  GoDriver driver(runner, "go");
  auto report = std::get<BuildTestReport>(driver.Verify(kGoSum, kGoSumTest, *ws, 5000));
  EXPECT_EQ(report.compile.tag, OutcomeTag::TOOLCHAIN_UNAVAILABLE);
  EXPECT_FALSE(report.test);
}

TEST_F(DriverTest, SolidityCompileOnly) {
  SolidityDriver driver(runner, "solc");
  EXPECT_FALSE(driver.SupportsTests());
  DriverReport report = driver.Verify(kContract, "ignored tests", *ws, 5000);
  ASSERT_TRUE(std::holds_alternative<CompileOnlyReport>(report));
  EXPECT_TRUE(std::get<CompileOnlyReport>(report).compile.compiled);

  ASSERT_EQ(runner.calls.size(), 1u);
  auto& call = runner.calls[0];
  EXPECT_EQ(call.options.argv,
            (std::vector<std::string>{"solc", "--abi", "--bin", "--optimize", "contract.sol"}));
  EXPECT_EQ(call.options.workdir, ws->Path().string());
  EXPECT_EQ(call.files["contract.sol"], kContract);

  TestRun tests = driver.RunTests(kContract, "x", *ws, 5000);
  EXPECT_EQ(tests.tag, OutcomeTag::INTERNAL_ERROR);
}

TEST_F(DriverTest, VersionCommands) {
  GoDriver go(runner, "/opt/go/bin/go");
  SolidityDriver solc(runner);
  EXPECT_EQ(go.VersionCommand(), (std::vector<std::string>{"/opt/go/bin/go", "version"}));
  EXPECT_EQ(solc.VersionCommand(), (std::vector<std::string>{kSolcBinary, "--version"}));
}

TEST(DriverRegistryTest, FindByLanguage) {
  FakeProcessRunner runner;
  DriverRegistry drivers = DefaultDrivers(runner);
  ASSERT_TRUE(drivers.Find(Language::GO));
  ASSERT_TRUE(drivers.Find(Language::SOLIDITY));
  EXPECT_TRUE(drivers.Find(Language::GO)->SupportsTests());
  EXPECT_EQ(drivers.Find(Language::SOLIDITY)->GetLanguage(), Language::SOLIDITY);
  EXPECT_EQ(drivers.All().size(), 2u);

  DriverRegistry go_only;
  go_only.Register(std::make_unique<GoDriver>(runner));
  EXPECT_FALSE(go_only.Find(Language::SOLIDITY));
}

TEST_F(DriverTest, RealGoToolchain) {
  if (!ToolInstalled(kGoBinary)) GTEST_SKIP() << "go not installed";
  PosixProcessRunner real;
  GoDriver driver(real);
  Outcome outcome = NormalizeReport(driver.Verify(kGoSum, kGoSumTest, *ws, 120000));
  EXPECT_EQ(outcome.tag, OutcomeTag::OK);
  ASSERT_TRUE(outcome.tests);
  EXPECT_TRUE(outcome.tests->passed);
  EXPECT_GE(outcome.tests->passed_count, 2);

  auto ws2 = Workspace::Acquire(kWorkspaceRoot);
  outcome = NormalizeReport(driver.Verify("package main\nfunc main() { x }\n", kGoSumTest, *ws2, 120000));
  EXPECT_EQ(outcome.tag, OutcomeTag::COMPILE_ERROR);
  EXPECT_FALSE(outcome.errors.empty());
}

TEST_F(DriverTest, RealSolidityToolchain) {
  if (!ToolInstalled(kSolcBinary)) GTEST_SKIP() << "solc not installed";
  PosixProcessRunner real;
  SolidityDriver driver(real);
  Outcome outcome = NormalizeReport(driver.Verify(kContract, "", *ws, 60000));
  EXPECT_TRUE(outcome.Passed());
  EXPECT_NE(outcome.output.find("Binary"), std::string::npos);
}
