#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "arx/common/diagnostic.hpp"

namespace arx::driver {

inline constexpr const char* kConfigFileName = "arx.toml";

struct ProjectConfig {
  std::string name;
  std::string entry;  // AST file, resolved against root_dir
  std::vector<std::string> map_dirs;
  std::string lib_dir;
  std::string out_dir = "out";
  std::string llc = "llc";
  std::string cxx = "c++";

  // Directory where arx.toml was found
  std::filesystem::path root_dir;
};

// Search for arx.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse arx.toml. Relative paths are resolved against the file's directory.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

// FindConfig + LoadConfig; nullopt when there is no arx.toml at all.
auto LoadOptionalConfig() -> Result<std::optional<ProjectConfig>>;

}  // namespace arx::driver
