#include <gtest/gtest.h>

#include <string>

#include <nlohmann/json.hpp>

#include "tests/cli/cli_test_fixture.hpp"
#include "tests/common/fixture_loader.hpp"

namespace xclog::test {
namespace {

using Json = nlohmann::json;

class ConfigTest : public CliTestFixture {};

// xclog.toml in the working directory turns on warnings without the flag
TEST_F(ConfigTest, ConfigEnablesWarnings) {
  WriteXclogToml("print_warnings = true\n");

  auto result = Run({"--input", FixturePath("build-warnings.log").string()});

  ASSERT_TRUE(result.Success()) << result.stderr_output;
  auto report = Json::parse(result.stdout_output);
  ASSERT_TRUE(report.contains("warnings"));
  EXPECT_EQ(report["warnings"].size(), 2U);
}

TEST_F(ConfigTest, ConfigCompactIndent) {
  WriteXclogToml("indent = -1\n");
  WriteFile("logs/build.log", LoadFixtureText("build-success.log"));

  auto result = Run({"--input", "logs/build.log"});

  ASSERT_TRUE(result.Success());
  EXPECT_EQ(
      result.stdout_output.find('\n'), result.stdout_output.size() - 1);
}

TEST_F(ConfigTest, NoConfigIgnoresFile) {
  WriteXclogToml("print_warnings = true\n");

  auto result = Run(
      {"--no-config", "--input", FixturePath("build-warnings.log").string()});

  ASSERT_TRUE(result.Success());
  EXPECT_FALSE(Json::parse(result.stdout_output).contains("warnings"));
}

TEST_F(ConfigTest, ExplicitConfigPath) {
  WriteFile("custom.toml", "[report]\nprint_warnings = true\n");

  auto result = Run(
      {"--config", "custom.toml", "--input",
       FixturePath("build-warnings.log").string()});

  ASSERT_TRUE(result.Success()) << result.stderr_output;
  EXPECT_TRUE(Json::parse(result.stdout_output).contains("warnings"));
}

TEST_F(ConfigTest, FlagOverridesConfigIndent) {
  WriteXclogToml("indent = 4\n");

  auto result = Run(
      {"--compact", "--input", FixturePath("build-success.log").string()});

  ASSERT_TRUE(result.Success());
  EXPECT_EQ(
      result.stdout_output.find('\n'), result.stdout_output.size() - 1);
}

TEST_F(ConfigTest, BadConfigFails) {
  WriteXclogToml("print_warnings = \"sometimes\"\n");

  auto result = Run({"--input", FixturePath("build-success.log").string()});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_TRUE(result.stdout_output.empty());
  EXPECT_NE(
      result.stderr_output.find("must be a boolean"), std::string::npos);
}

TEST_F(ConfigTest, MissingExplicitConfigFails) {
  auto result = Run(
      {"--config", "absent.toml", "--input",
       FixturePath("build-success.log").string()});

  EXPECT_EQ(result.exit_code, 1);
  EXPECT_NE(
      result.stderr_output.find("config file not found"), std::string::npos);
}

}  // namespace
}  // namespace xclog::test
