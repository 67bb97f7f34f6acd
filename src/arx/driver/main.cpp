#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include <argparse/argparse.hpp>
#include <fmt/core.h>

#include "arx/common/internal_error.hpp"
#include "commands.hpp"
#include "input.hpp"
#include "print.hpp"

namespace fs = std::filesystem;

auto main(int argc, char* argv[]) -> int {
  argparse::ArgumentParser program("arx", "0.1.0");
  program.add_description("Compile arx programs to LLVM IR and native code");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");

  // Subcommand: build
  argparse::ArgumentParser build_cmd("build");
  build_cmd.add_description("Compile and link a native executable");
  arx::driver::AddCompilationFlags(build_cmd);
  build_cmd.add_argument("file").nargs(0, 1).help(
      "AST file (uses arx.toml if not specified)");

  // Subcommand: emit
  argparse::ArgumentParser emit_cmd("emit");
  emit_cmd.add_description("Print the generated LLVM IR");
  arx::driver::AddCompilationFlags(emit_cmd);
  emit_cmd.add_argument("-o").help("Write IR to <file>").metavar("file");
  emit_cmd.add_argument("file").nargs(0, 1).help(
      "AST file (uses arx.toml if not specified)");

  // Subcommand: check
  argparse::ArgumentParser check_cmd("check");
  check_cmd.add_description("Lower a program and report errors");
  arx::driver::AddCompilationFlags(check_cmd);
  check_cmd.add_argument("file").nargs(0, 1).help(
      "AST file (uses arx.toml if not specified)");

  // Subcommand: init
  argparse::ArgumentParser init_cmd("init");
  init_cmd.add_description("Create a new arx project");
  init_cmd.add_argument("name").nargs(0, 1).help("Project name");
  init_cmd.add_argument("--force", "-f")
      .default_value(false)
      .implicit_value(true)
      .help("Overwrite existing arx.toml");

  program.add_subparser(build_cmd);
  program.add_subparser(emit_cmd);
  program.add_subparser(check_cmd);
  program.add_subparser(init_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    arx::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      arx::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  try {
    if (program.is_subcommand_used("build")) {
      return arx::driver::BuildCommand(build_cmd);
    }
    if (program.is_subcommand_used("emit")) {
      return arx::driver::EmitCommand(emit_cmd);
    }
    if (program.is_subcommand_used("check")) {
      return arx::driver::CheckCommand(check_cmd);
    }
    if (program.is_subcommand_used("init")) {
      return arx::driver::InitCommand(init_cmd);
    }
  } catch (const arx::common::InternalError& e) {
    arx::driver::PrintError(e.what());
    return 2;
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}
