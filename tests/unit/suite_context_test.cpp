#include <gtest/gtest.h>

#include "xclog/parse/suite_context.hpp"

namespace xclog::parse {
namespace {

TEST(SuiteContextTest, ExtractsQuotedSuiteName) {
  EXPECT_EQ(
      MatchSuiteStarted(
          "Test Suite 'MyAppTests' started at 2024-01-15 10:30:00.002."),
      "MyAppTests");
  EXPECT_EQ(
      MatchSuiteStarted("Test Suite 'All tests' started at 2024-01-15"),
      "All tests");
}

TEST(SuiteContextTest, FinishedSuiteIsNotAnAnnouncement) {
  EXPECT_FALSE(
      MatchSuiteStarted("Test Suite 'MyAppTests' passed at 2024-01-15")
          .has_value());
  EXPECT_FALSE(MatchSuiteStarted("◇ Suite MyAppTests started.").has_value());
}

TEST(SuiteContextTest, NameIsBetweenFirstTwoQuotes) {
  EXPECT_EQ(
      MatchSuiteStarted("note 'x' Test Suite 'Real' started at now"), "x");
}

TEST(SuiteContextTest, DefaultsToSwiftTestingLabel) {
  SuiteContext context;
  EXPECT_FALSE(context.Current().has_value());
  EXPECT_EQ(context.NameOrLabel(), "Swift Testing");
}

TEST(SuiteContextTest, LatestAnnouncementWins) {
  SuiteContext context;
  context.Set("First");
  context.Set("Second");
  EXPECT_EQ(context.Current(), "Second");
  EXPECT_EQ(context.NameOrLabel(), "Second");
}

}  // namespace
}  // namespace xclog::parse
