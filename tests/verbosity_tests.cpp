#include <gtest/gtest.h>

#include "../src/utils/verbose/verbosity.hpp"

using utils::verbose::Verbosity;
using utils::verbose::VerbosityParser;

TEST(VerbosityParserTest, FullNames) {
  VerbosityParser parser;
  EXPECT_EQ(parser.TryParse("quiet"), Verbosity::kQuiet);
  EXPECT_EQ(parser.TryParse("minimal"), Verbosity::kMinimal);
  EXPECT_EQ(parser.TryParse("normal"), Verbosity::kNormal);
  EXPECT_EQ(parser.TryParse("verbose"), Verbosity::kVerbose);
  EXPECT_EQ(parser.TryParse("diagnostic"), Verbosity::kDiagnostic);
}

TEST(VerbosityParserTest, AbbreviationsIgnoreCase) {
  VerbosityParser parser;
  EXPECT_EQ(parser.TryParse("Q"), Verbosity::kQuiet);
  EXPECT_EQ(parser.TryParse("m"), Verbosity::kMinimal);
  EXPECT_EQ(parser.TryParse("N"), Verbosity::kNormal);
  EXPECT_EQ(parser.TryParse("v"), Verbosity::kVerbose);
  EXPECT_EQ(parser.TryParse("DIAGNOSTIC"), Verbosity::kDiagnostic);
}

TEST(VerbosityParserTest, UnknownNames) {
  VerbosityParser parser;
  EXPECT_FALSE(parser.TryParse("").has_value());
  EXPECT_FALSE(parser.TryParse("bogus").has_value());
  EXPECT_FALSE(parser.TryParse("diag").has_value());
}

TEST(VerbosityTest, ToString) {
  EXPECT_EQ(utils::verbose::ToString(Verbosity::kNormal), "Normal");
  EXPECT_EQ(utils::verbose::ToString(Verbosity::kDiagnostic), "Diagnostic");
}
