#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "arx/ast/arena.hpp"
#include "arx/common/diagnostic.hpp"
#include "arx/extern_link/resolver.hpp"
#include "arx/lowering/ast_to_llvm/lower.hpp"

namespace arx::test {

// Directory holding the bundled `maps/` and `lib/` (set by the build).
auto StdlibDir() -> std::filesystem::path;

// A program compiled from inline YAML. Owns the AST so tests can inspect
// both sides.
struct CompiledProgram {
  ast::CompilationUnit unit;
  extern_link::LinkResult link;
  lowering::ast_to_llvm::LoweringResult llvm;
};

// Load `yaml`, resolve its `uses` against the bundled descriptors plus
// `extra_map_dirs`, and lower. Any failing stage returns its diagnostic.
auto CompileYaml(
    std::string_view yaml,
    const std::vector<std::filesystem::path>& extra_map_dirs = {})
    -> Result<CompiledProgram>;

// Lower against a caller-built overload table (no descriptor files).
auto LowerYaml(std::string_view yaml, const extern_link::OverloadTable& table)
    -> Result<lowering::ast_to_llvm::LoweringResult>;

struct RunResult {
  int exit_code = 0;
  std::string output;  // Everything the program wrote to stdout
};

// JIT-compile the module in-process and call `entry` as `int()`. The runtime
// library (core_*, math_*) is linked into the test binary and exposed to the
// JIT directly.
auto RunModule(
    lowering::ast_to_llvm::LoweringResult lowered,
    const std::string& entry = "main") -> std::expected<RunResult, std::string>;

// CompileYaml + RunModule. Compile errors are reported as strings.
auto RunYaml(std::string_view yaml, const std::string& entry = "main")
    -> std::expected<RunResult, std::string>;

}  // namespace arx::test
