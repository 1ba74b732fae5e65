#include "config.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>

#include <fmt/core.h>
#include <toml++/toml.hpp>

#include "xclog/common/diagnostic/diagnostic.hpp"

namespace xclog::driver {

namespace fs = std::filesystem;

namespace {

auto LocationOf(const fs::path& config_path, const toml::node& node)
    -> FileLocation {
  const auto& begin = node.source().begin;
  return FileLocation{
      .path = config_path.string(),
      .line = begin ? std::optional<uint32_t>(begin.line) : std::nullopt,
      .column = begin ? std::optional<uint32_t>(begin.column) : std::nullopt,
  };
}

}  // namespace

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  ProjectConfig config;
  config.path = config_path;

  if (!fs::exists(config_path)) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("config file not found: {}", config_path.string())));
  }

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    const auto& begin = e.source().begin;
    return std::unexpected(
        Diagnostic::HostError(
            FileLocation{
                .path = config_path.string(),
                .line = begin.line,
                .column = begin.column,
            },
            fmt::format("failed to parse config: {}", e.description())));
  }

  // [report] section (optional)
  auto* report = tbl["report"].as_table();
  if (report == nullptr) {
    return config;
  }

  if (const toml::node* node = report->get("print_warnings")) {
    auto value = node->value_exact<bool>();
    if (!value) {
      return std::unexpected(
          Diagnostic::HostError(
              LocationOf(config_path, *node),
              "'report.print_warnings' must be a boolean"));
    }
    config.print_warnings = *value;
  }

  if (const toml::node* node = report->get("indent")) {
    auto value = node->value_exact<int64_t>();
    if (!value || *value < -1 || *value > 16) {
      return std::unexpected(
          Diagnostic::HostError(
              LocationOf(config_path, *node),
              "'report.indent' must be an integer from -1 to 16")
              .WithNote("use -1 for single-line output"));
    }
    config.indent = static_cast<int>(*value);
  }

  return config;
}

}  // namespace xclog::driver
