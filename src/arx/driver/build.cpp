#include "build.hpp"

#include <cstddef>
#include <expected>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>

#include "arx/common/diagnostic.hpp"
#include "arx/common/subprocess.hpp"
#include "arx/lowering/ast_to_llvm/lower.hpp"
#include "arx/toolchain/toolchain.hpp"
#include "pipeline.hpp"
#include "print.hpp"
#include "verbose_logger.hpp"

namespace arx::driver {

namespace {

namespace fs = std::filesystem;

// Run one external tool; a non-zero exit becomes a process failure carrying
// the tool's output as a note.
auto RunTool(
    const std::vector<std::string>& argv, const char* phase,
    VerboseLogger& vlog) -> Result<void> {
  vlog.Detail(phase, fmt::format("{}", fmt::join(argv, " ")));
  auto result = common::RunSubprocess(argv);
  if (result.exit_code == 0) {
    return {};
  }
  auto diag = Diagnostic::HostError(
      ErrorCategory::kProcessFailure,
      fmt::format("'{}' exited with status {}", argv[0], result.exit_code));
  if (!result.output.empty()) {
    diag = std::move(diag).WithNote(result.output);
  }
  return std::unexpected(std::move(diag));
}

auto FindLibrarySource(
    const std::vector<fs::path>& lib_dirs, const std::string& module)
    -> Result<fs::path> {
  std::vector<std::string> searched;
  for (const auto& dir : lib_dirs) {
    auto candidate = dir / (module + ".cpp");
    std::error_code ec;
    if (fs::is_regular_file(candidate, ec)) {
      return candidate;
    }
    searched.push_back(dir.string());
  }
  return std::unexpected(
      Diagnostic::HostError(
          ErrorCategory::kDescriptor,
          fmt::format(
              "no library source '{}.cpp' for extern module '{}' "
              "(searched: {})",
              module, module, fmt::join(searched, ", "))));
}

auto CreateDirectory(const fs::path& dir) -> Result<void> {
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    return std::unexpected(
        Diagnostic::HostError(
            ErrorCategory::kEnvironment,
            fmt::format("cannot create '{}': {}", dir.string(), ec.message())));
  }
  return {};
}

}  // namespace

auto BuildExecutable(
    const CompilationInput& input, const CompilationResult& compiled,
    VerboseLogger& vlog) -> Result<fs::path> {
  auto status = toolchain::CheckToolchain(input.llc, input.cxx);
  if (!status.ok) {
    auto diag = Diagnostic::HostError(
        ErrorCategory::kEnvironment,
        "required toolchain binaries are missing");
    for (const auto& error : status.errors) {
      diag = std::move(diag).WithNote(error);
    }
    return std::unexpected(std::move(diag));
  }
  std::string llc = toolchain::FindExecutable(input.llc);
  std::string cxx = toolchain::FindExecutable(input.cxx);

  // Every library source must exist before anything is written
  const auto& modules = compiled.link.loaded_modules;
  std::vector<fs::path> sources;
  for (const auto& module : modules) {
    auto source = FindLibrarySource(input.lib_dirs, module);
    if (!source) {
      return std::unexpected(std::move(source.error()));
    }
    sources.push_back(*source);
  }

  fs::path build_dir = input.out_dir / "build";
  fs::path bin_dir = input.out_dir / "bin";
  if (auto r = CreateDirectory(build_dir); !r) {
    return std::unexpected(std::move(r.error()));
  }
  if (auto r = CreateDirectory(bin_dir); !r) {
    return std::unexpected(std::move(r.error()));
  }

  std::string stem = ProgramStem(input.ast_path);
  fs::path ll_path = build_dir / (stem + ".ll");
  fs::path main_obj = build_dir / (stem + ".o");
  {
    std::ofstream out(ll_path);
    if (!out) {
      return std::unexpected(
          Diagnostic::HostError(
              ErrorCategory::kEnvironment,
              fmt::format("cannot write '{}'", ll_path.string())));
    }
    out << lowering::ast_to_llvm::DumpLlvmIr(compiled.llvm);
  }

  {
    PhaseTimer timer(vlog, "llc");
    auto r = RunTool(
        {llc, ll_path.string(), "-filetype=obj", "-o", main_obj.string()},
        "llc", vlog);
    if (!r) {
      return std::unexpected(std::move(r.error()));
    }
  }

  PhaseTimer timer(vlog, "link");
  std::vector<std::string> link_argv = {cxx, main_obj.string()};
  std::size_t total = modules.size() + 1;
  for (std::size_t i = 0; i < modules.size(); ++i) {
    fmt::print("[ {}/{} ] [lib] ({})\n", i + 1, total, modules[i]);
    fs::path obj = build_dir / (modules[i] + ".o");
    auto r = RunTool(
        {cxx, "-c", "-O2", "-o", obj.string(), sources[i].string()}, "link",
        vlog);
    if (!r) {
      return std::unexpected(std::move(r.error()));
    }
    link_argv.push_back(obj.string());
  }

  fmt::print("[ {}/{} ] [main]\n", total, total);
  fs::path exe_path = bin_dir / stem;
  link_argv.emplace_back("-o");
  link_argv.push_back(exe_path.string());
  if (auto r = RunTool(link_argv, "link", vlog); !r) {
    return std::unexpected(std::move(r.error()));
  }
  return exe_path;
}

auto Build(const CompilationInput& input) -> int {
  VerboseLogger vlog(input.verbosity);

  auto compiled = CompileToLlvm(input, vlog);
  if (!compiled) {
    compiled.error().Print();
    return 1;
  }

  auto exe = BuildExecutable(input, *compiled, vlog);
  if (!exe) {
    PrintDiagnostic(exe.error());
    return 1;
  }

  fmt::print("Built at [ {} ]\n", exe->string());
  vlog.PrintPhaseSummary();
  return 0;
}

}  // namespace arx::driver
