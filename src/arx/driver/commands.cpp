#include "commands.hpp"

#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

#include <argparse/argparse.hpp>
#include <fmt/core.h>

#include "build.hpp"
#include "config.hpp"
#include "emit.hpp"
#include "input.hpp"
#include "print.hpp"

namespace arx::driver {

namespace {

namespace fs = std::filesystem;

// Starter program: prints a greeting through the core extern module.
auto HelloProgram(const std::string& name) -> std::string {
  return fmt::format(
      "uses: []\n"
      "functions:\n"
      "  - name: main\n"
      "    return: int\n"
      "    body:\n"
      "      - expr: {{method: {{object: core, name: print, "
      "args: [{{str: \"Hello from {}!\"}}]}}}}\n"
      "      - return: {{int: 0}}\n",
      name);
}

}  // namespace

auto BuildCommand(const argparse::ArgumentParser& cmd) -> int {
  auto input = PrepareInput(cmd);
  if (!input) {
    PrintDiagnostic(input.error());
    return 1;
  }
  return Build(*input);
}

auto EmitCommand(const argparse::ArgumentParser& cmd) -> int {
  auto input = PrepareInput(cmd);
  if (!input) {
    PrintDiagnostic(input.error());
    return 1;
  }
  return Emit(*input, cmd.present<std::string>("-o"));
}

auto CheckCommand(const argparse::ArgumentParser& cmd) -> int {
  auto input = PrepareInput(cmd);
  if (!input) {
    PrintDiagnostic(input.error());
    return 1;
  }
  return Check(*input);
}

auto InitCommand(const argparse::ArgumentParser& cmd) -> int {
  std::optional<std::string> name = cmd.present<std::string>("name");
  bool force = cmd.get<bool>("--force");

  fs::path project_dir;
  std::string project_name;
  bool create_directory = false;

  if (name) {
    project_dir = fs::path(*name);
    if (project_dir.is_relative()) {
      project_dir = fs::current_path() / project_dir;
    }
    project_name = project_dir.filename().string();
    create_directory = true;

    if (fs::exists(project_dir)) {
      PrintError(
          fmt::format("directory '{}' already exists", project_dir.string()));
      return 1;
    }
  } else {
    project_dir = fs::current_path();
    project_name = project_dir.filename().string();

    if (fs::exists(project_dir / kConfigFileName) && !force) {
      PrintError("arx.toml already exists (use --force to overwrite)");
      return 1;
    }
  }

  std::string entry = project_name + ".ast.yaml";
  try {
    if (create_directory) {
      fs::create_directories(project_dir / "maps");
      fs::create_directories(project_dir / "lib");
      std::ofstream ast_file(project_dir / entry);
      ast_file << HelloProgram(project_name);
    }

    std::ofstream toml_file(project_dir / kConfigFileName);
    toml_file << fmt::format(
        "[package]\n"
        "name = \"{}\"\n"
        "entry = \"{}\"\n"
        "\n"
        "[extern]\n"
        "map_dirs = [\"maps\"]\n"
        "lib_dir = \"lib\"\n"
        "\n"
        "[build]\n"
        "out_dir = \"out\"\n",
        project_name, entry);
  } catch (const std::exception& e) {
    PrintError(e.what());
    return 1;
  }

  fmt::print("Created project '{}'\n", project_name);
  return 0;
}

}  // namespace arx::driver
