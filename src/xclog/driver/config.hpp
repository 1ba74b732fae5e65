#pragma once

#include <filesystem>
#include <optional>

#include "xclog/common/diagnostic/diagnostic.hpp"

namespace xclog::driver {

inline constexpr const char* kConfigFileName = "xclog.toml";

// Defaults read from xclog.toml. Unset fields leave the built-in default;
// command-line flags override both.
struct ProjectConfig {
  std::optional<bool> print_warnings;
  std::optional<int> indent;

  // File the config was loaded from
  std::filesystem::path path;
};

// Search for xclog.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse an xclog.toml file.
// Returns error Diagnostic on parse errors or wrongly typed keys.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

}  // namespace xclog::driver
