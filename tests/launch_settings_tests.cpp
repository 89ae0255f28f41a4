#include <gtest/gtest.h>

#include "../src/main/launch_settings.hpp"

TEST(LaunchSettingsTest, Defaults) {
  LaunchSettings settings;
  EXPECT_EQ(settings.script.string(), "./build.cake");
  EXPECT_EQ(settings.verbosity, utils::verbose::Verbosity::kNormal);
  EXPECT_FALSE(settings.has_error);
  EXPECT_TRUE(settings.arguments.empty());
}

TEST(LaunchSettingsTest, AddArgument_RejectsDuplicateIgnoringCase) {
  LaunchSettings settings;
  EXPECT_TRUE(settings.AddArgument("Target", "Build"));
  EXPECT_FALSE(settings.AddArgument("target", "Test"));
  EXPECT_EQ(settings.arguments.size(), 1u);
  EXPECT_EQ(settings.GetArgument("TARGET").value(), "Build");
}

TEST(LaunchSettingsTest, GetArgument_Missing) {
  LaunchSettings settings;
  EXPECT_FALSE(settings.HasArgument("target"));
  EXPECT_FALSE(settings.GetArgument("target").has_value());
}

TEST(LaunchSettingsTest, GetArgument_EmptyValue) {
  LaunchSettings settings;
  settings.AddArgument("debug", "");
  EXPECT_TRUE(settings.HasArgument("Debug"));
  EXPECT_EQ(settings.GetArgument("debug").value(), "");
}
