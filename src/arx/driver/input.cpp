#include "input.hpp"

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <argparse/argparse.hpp>
#include <fmt/core.h>

#include "arx/common/diagnostic.hpp"
#include "config.hpp"
#include "stdlib_path.hpp"

namespace arx::driver {

namespace {

namespace fs = std::filesystem;

auto Absolute(const std::string& path) -> fs::path {
  return fs::absolute(path).lexically_normal();
}

}  // namespace

void AddCompilationFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("-M", "--map-dir")
      .append()
      .help("Extern descriptor directory (repeatable)")
      .metavar("dir");
  cmd.add_argument("--lib-dir")
      .help("Directory with extern library sources (<module>.cpp)")
      .metavar("dir");
  cmd.add_argument("-v", "--verbose")
      .append()
      .default_value(false)
      .implicit_value(true)
      .nargs(0)
      .help("Verbose output (repeat for more detail)");
}

auto BuildInput(
    const argparse::ArgumentParser& cmd,
    const std::optional<ProjectConfig>& config) -> Result<CompilationInput> {
  CompilationInput input;

  if (auto file = cmd.present<std::string>("file")) {
    input.ast_path = Absolute(*file);
  } else if (config && !config->entry.empty()) {
    input.ast_path = config->entry;
  } else {
    return std::unexpected(
        Diagnostic::HostError(
            ErrorCategory::kInput,
            "no input file (pass one, or set 'package.entry' in arx.toml)"));
  }
  if (!fs::exists(input.ast_path)) {
    return std::unexpected(
        Diagnostic::HostError(
            ErrorCategory::kInput,
            fmt::format("input file not found: {}", input.ast_path.string())));
  }

  // Bundled standard library first so project and CLI descriptors override
  // its entries.
  std::vector<std::string> tried_paths;
  fs::path stdlib_dir = FindStdlibDir(tried_paths);
  if (!stdlib_dir.empty()) {
    input.map_dirs.push_back(stdlib_dir / "maps");
  }
  if (config) {
    for (const auto& dir : config->map_dirs) {
      input.map_dirs.emplace_back(dir);
    }
  }
  if (auto dirs = cmd.present<std::vector<std::string>>("-M")) {
    for (const auto& dir : *dirs) {
      input.map_dirs.push_back(Absolute(dir));
    }
  }
  if (input.map_dirs.empty()) {
    std::string tried;
    for (const auto& path : tried_paths) {
      tried += fmt::format("\n  {}", path);
    }
    return std::unexpected(
        Diagnostic::HostError(
            ErrorCategory::kDescriptor,
            fmt::format(
                "cannot find the arx standard library (set ARX_STDLIB_PATH "
                "or pass -M); tried:{}",
                tried)));
  }

  if (auto lib_dir = cmd.present<std::string>("--lib-dir")) {
    input.lib_dirs.push_back(Absolute(*lib_dir));
  }
  if (config && !config->lib_dir.empty()) {
    input.lib_dirs.emplace_back(config->lib_dir);
  }
  if (!stdlib_dir.empty()) {
    input.lib_dirs.push_back(stdlib_dir / "lib");
  }

  if (config) {
    input.out_dir = config->out_dir;
    input.llc = config->llc;
    input.cxx = config->cxx;
  } else {
    input.out_dir = fs::current_path() / "out";
  }

  if (cmd.is_used("-v")) {
    input.verbosity =
        static_cast<int>(cmd.get<std::vector<bool>>("-v").size());
  }

  return input;
}

auto PrepareInput(const argparse::ArgumentParser& cmd)
    -> Result<CompilationInput> {
  auto config = LoadOptionalConfig();
  if (!config) {
    return std::unexpected(std::move(config.error()));
  }
  return BuildInput(cmd, *config);
}

}  // namespace arx::driver
