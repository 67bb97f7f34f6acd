#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <argparse/argparse.hpp>

#include "arx/common/diagnostic.hpp"
#include "config.hpp"

namespace arx::driver {

// Everything a command needs, after merging CLI flags, arx.toml and the
// bundled standard library location.
struct CompilationInput {
  std::filesystem::path ast_path;

  // Descriptor search dirs, lowest precedence first. Later directories win
  // when two descriptors define the same overload.
  std::vector<std::filesystem::path> map_dirs;

  // Where `<module>.cpp` sources are looked up, highest precedence first.
  std::vector<std::filesystem::path> lib_dirs;

  std::filesystem::path out_dir = "out";
  std::string llc = "llc";
  std::string cxx = "c++";
  int verbosity = 0;
};

// Add -M/--map-dir, --lib-dir and -v flags to a subcommand.
void AddCompilationFlags(argparse::ArgumentParser& cmd);

// Merge CLI arguments and optional config into a CompilationInput.
auto BuildInput(
    const argparse::ArgumentParser& cmd,
    const std::optional<ProjectConfig>& config) -> Result<CompilationInput>;

// Load the optional arx.toml, then BuildInput.
auto PrepareInput(const argparse::ArgumentParser& cmd)
    -> Result<CompilationInput>;

}  // namespace arx::driver
