#include <gtest/gtest.h>

#include "../src/main/main_processor.hpp"

#include <cstdlib>
#include <initializer_list>
#include <sstream>
#include <string>
#include <vector>

namespace {
class RecordingBuildEngine : public BuildEngine {
public:
  int Run(const LaunchSettings &settings) override {
    runs++;
    last_settings = settings;
    return exit_code;
  }

  int runs = 0;
  int exit_code = EXIT_SUCCESS;
  LaunchSettings last_settings;
};
} // namespace

class MainProcessorTest : public ::testing::Test {
protected:
  int Run(std::initializer_list<const char *> args) {
    std::vector<std::string> owned{"cakelaunch"};
    for (const char *arg : args) {
      owned.emplace_back(arg);
    }
    std::vector<char *> argv;
    for (auto &item : owned) {
      argv.push_back(item.data());
    }
    MainProcessor processor(engine_, log_, help_);
    return processor.main(static_cast<int>(argv.size()), argv.data());
  }

  RecordingBuildEngine engine_;
  std::ostringstream out_;
  std::ostringstream err_;
  std::ostringstream help_;
  loger::Log log_{out_, err_};
};

TEST_F(MainProcessorTest, RunsBuildWithDefaultScript) {
  EXPECT_EQ(Run({}), EXIT_SUCCESS);
  EXPECT_EQ(engine_.runs, 1);
  EXPECT_EQ(engine_.last_settings.script.string(), "./build.cake");
  EXPECT_TRUE(err_.str().empty());
}

TEST_F(MainProcessorTest, ReturnsEngineExitCode) {
  engine_.exit_code = 3;
  EXPECT_EQ(Run({"build.cake", "--target=Test"}), 3);
  EXPECT_EQ(engine_.last_settings.GetArgument("target").value(), "Test");
}

TEST_F(MainProcessorTest, UsageErrorPrintsErrorAndHelp) {
  EXPECT_EQ(Run({"a.cake", "b.cake"}), EXIT_FAILURE);
  EXPECT_EQ(engine_.runs, 0);
  EXPECT_NE(err_.str().find("Error: More than one build script specified."),
            std::string::npos);
  EXPECT_NE(help_.str().find("Usage: cakelaunch"), std::string::npos);
}

TEST_F(MainProcessorTest, InvalidVerbosityIsUsageError) {
  EXPECT_EQ(Run({"-verbosity=loud"}), EXIT_FAILURE);
  EXPECT_EQ(engine_.runs, 0);
  EXPECT_NE(err_.str().find("'loud' is not a valid verbosity"),
            std::string::npos);
}

TEST_F(MainProcessorTest, InvalidBooleanIsReported) {
  EXPECT_EQ(Run({"--dryrun=notabool"}), EXIT_FAILURE);
  EXPECT_EQ(engine_.runs, 0);
  EXPECT_NE(err_.str().find("not a valid boolean value"), std::string::npos);
  EXPECT_TRUE(help_.str().empty());
}

TEST_F(MainProcessorTest, HelpWinsOverVersion) {
  EXPECT_EQ(Run({"--version", "--help"}), EXIT_SUCCESS);
  EXPECT_EQ(engine_.runs, 0);
  EXPECT_EQ(help_.str().rfind("Usage: cakelaunch", 0), 0u);
  EXPECT_EQ(help_.str().find("cakelaunch version "), std::string::npos);
}

TEST_F(MainProcessorTest, VersionPrintsVersion) {
  EXPECT_EQ(Run({"-ver"}), EXIT_SUCCESS);
  EXPECT_EQ(engine_.runs, 0);
  EXPECT_EQ(help_.str().rfind("cakelaunch version ", 0), 0u);
}

TEST_F(MainProcessorTest, HelpPrintsOptions) {
  EXPECT_EQ(Run({"-?"}), EXIT_SUCCESS);
  EXPECT_EQ(engine_.runs, 0);
  EXPECT_NE(help_.str().find("-showdescription"), std::string::npos);
  EXPECT_NE(help_.str().find("q[uiet]"), std::string::npos);
}

TEST_F(MainProcessorTest, VerbosityAppliesToLog) {
  EXPECT_EQ(Run({"build.cake", "-v=diagnostic", "-target=Pack"}),
            EXIT_SUCCESS);
  EXPECT_EQ(log_.GetVerbosity(), utils::verbose::Verbosity::kDiagnostic);
  EXPECT_NE(out_.str().find("Build script: build.cake"), std::string::npos);
  EXPECT_NE(out_.str().find("Argument target=Pack"), std::string::npos);
}

TEST_F(MainProcessorTest, NormalVerbosityHidesProgress) {
  EXPECT_EQ(Run({"build.cake"}), EXIT_SUCCESS);
  EXPECT_TRUE(out_.str().empty());
}
