#include "config.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

#include "arx/common/diagnostic.hpp"
#include "toml++/toml.hpp"

namespace arx::driver {

namespace fs = std::filesystem;

namespace {

auto ConfigError(const fs::path& config_path, std::string_view msg)
    -> Diagnostic {
  return Diagnostic::HostError(
      ErrorCategory::kInput, fmt::format("{}: {}", config_path.string(), msg));
}

auto ResolveAgainst(const fs::path& root, const std::string& value)
    -> std::string {
  fs::path path = value;
  if (path.is_relative()) {
    path = root / path;
  }
  return path.lexically_normal().string();
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
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  ProjectConfig config;
  config.root_dir = fs::absolute(config_path).parent_path();

  toml::table tbl;
  try {
    tbl = toml::parse_file(config_path.string());
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            ErrorCategory::kInput,
            fmt::format(
                "failed to parse {}: {}", config_path.string(),
                e.description())));
  }

  // [package] section
  auto package = tbl["package"];
  if (!package) {
    return std::unexpected(
        ConfigError(config_path, "missing [package] section"));
  }

  auto name = package["name"].value<std::string>();
  if (!name) {
    return std::unexpected(
        ConfigError(config_path, "missing required field 'package.name'"));
  }
  config.name = *name;

  if (auto entry = package["entry"].value<std::string>()) {
    config.entry = ResolveAgainst(config.root_dir, *entry);
  }

  // [extern] section (optional)
  if (auto ext = tbl["extern"]) {
    if (auto* dirs = ext["map_dirs"].as_array()) {
      for (const auto& elem : *dirs) {
        auto str = elem.value<std::string>();
        if (!str) {
          return std::unexpected(
              ConfigError(config_path, "'extern.map_dirs' must hold strings"));
        }
        config.map_dirs.push_back(ResolveAgainst(config.root_dir, *str));
      }
    }
    if (auto lib_dir = ext["lib_dir"].value<std::string>()) {
      config.lib_dir = ResolveAgainst(config.root_dir, *lib_dir);
    }
  }

  // [build] section (optional)
  if (auto build = tbl["build"]) {
    if (auto out_dir = build["out_dir"].value<std::string>()) {
      config.out_dir = ResolveAgainst(config.root_dir, *out_dir);
    }
  }
  if (fs::path(config.out_dir).is_relative()) {
    config.out_dir = ResolveAgainst(config.root_dir, config.out_dir);
  }

  // [toolchain] section (optional)
  if (auto toolchain = tbl["toolchain"]) {
    if (auto llc = toolchain["llc"].value<std::string>()) {
      config.llc = *llc;
    }
    if (auto cxx = toolchain["cxx"].value<std::string>()) {
      config.cxx = *cxx;
    }
  }

  return config;
}

auto LoadOptionalConfig() -> Result<std::optional<ProjectConfig>> {
  auto path = FindConfig();
  if (!path) {
    return std::optional<ProjectConfig>{};
  }
  auto config = LoadConfig(*path);
  if (!config) {
    return std::unexpected(std::move(config.error()));
  }
  return std::optional<ProjectConfig>{std::move(*config)};
}

}  // namespace arx::driver
