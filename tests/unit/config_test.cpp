#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <variant>

#include "config.hpp"
#include "xclog/common/diagnostic/diagnostic.hpp"

namespace xclog::driver {
namespace {

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    dir_ = fs::temp_directory_path() /
           (std::string("xclog_config_test_") + info->name());
    fs::remove_all(dir_);
    fs::create_directories(dir_);
  }

  void TearDown() override {
    fs::remove_all(dir_);
  }

  auto WriteConfig(const std::string& content, const fs::path& subdir = {})
      -> fs::path {
    fs::path path = dir_ / subdir / kConfigFileName;
    fs::create_directories(path.parent_path());
    std::ofstream out(path);
    out << content;
    return path;
  }

  fs::path dir_;
};

TEST_F(ConfigTest, ReadsReportSection) {
  auto path = WriteConfig(
      "[report]\n"
      "print_warnings = true\n"
      "indent = 4\n");

  auto config = LoadConfig(path);
  ASSERT_TRUE(config.has_value()) << config.error().primary.message;
  EXPECT_EQ(config->print_warnings, true);
  EXPECT_EQ(config->indent, 4);
  EXPECT_EQ(config->path, path);
}

TEST_F(ConfigTest, MissingSectionLeavesDefaults) {
  auto path = WriteConfig("# nothing here\n");

  auto config = LoadConfig(path);
  ASSERT_TRUE(config.has_value());
  EXPECT_FALSE(config->print_warnings.has_value());
  EXPECT_FALSE(config->indent.has_value());
}

TEST_F(ConfigTest, CompactIndentAccepted) {
  auto config = LoadConfig(WriteConfig("[report]\nindent = -1\n"));
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->indent, -1);
}

TEST_F(ConfigTest, MissingFile) {
  auto config = LoadConfig(dir_ / "absent.toml");
  ASSERT_FALSE(config.has_value());
  EXPECT_NE(
      config.error().primary.message.find("config file not found"),
      std::string::npos);
}

TEST_F(ConfigTest, WrongTypeForPrintWarnings) {
  auto config = LoadConfig(WriteConfig("[report]\nprint_warnings = \"yes\"\n"));

  ASSERT_FALSE(config.has_value());
  EXPECT_EQ(
      config.error().primary.message,
      "'report.print_warnings' must be a boolean");
  const auto* loc = std::get_if<FileLocation>(&config.error().primary.span);
  ASSERT_NE(loc, nullptr);
  EXPECT_EQ(loc->line, 2U);
}

TEST_F(ConfigTest, IndentOutOfRange) {
  auto config = LoadConfig(WriteConfig("[report]\nindent = 40\n"));

  ASSERT_FALSE(config.has_value());
  ASSERT_EQ(config.error().notes.size(), 1U);
  EXPECT_EQ(config.error().notes[0].message, "use -1 for single-line output");
}

TEST_F(ConfigTest, SyntaxError) {
  auto config = LoadConfig(WriteConfig("[report\nindent = 2\n"));

  ASSERT_FALSE(config.has_value());
  EXPECT_NE(
      config.error().primary.message.find("failed to parse config"),
      std::string::npos);
  EXPECT_TRUE(
      std::holds_alternative<FileLocation>(config.error().primary.span));
}

TEST_F(ConfigTest, FindConfigWalksUp) {
  auto path = WriteConfig("[report]\n");
  fs::create_directories(dir_ / "a" / "b");

  auto found = FindConfig(dir_ / "a" / "b");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(path));
}

TEST_F(ConfigTest, FindConfigPrefersNearest) {
  WriteConfig("[report]\n");
  auto nearer = WriteConfig("[report]\n", "inner");

  auto found = FindConfig(dir_ / "inner");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(nearer));
}

}  // namespace
}  // namespace xclog::driver
