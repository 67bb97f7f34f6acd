#pragma once

#include <expected>
#include <string>

#include "arx/ast/arena.hpp"
#include "arx/common/diagnostic.hpp"
#include "arx/common/diagnostic_sink.hpp"
#include "arx/extern_link/resolver.hpp"
#include "arx/lowering/ast_to_llvm/lower.hpp"
#include "input.hpp"
#include "verbose_logger.hpp"

namespace arx::driver {

struct CompilationResult {
  ast::CompilationUnit unit;
  extern_link::LinkResult link;
  lowering::ast_to_llvm::LoweringResult llvm;
};

struct CompilationError {
  DiagnosticSink diagnostics;
  std::string file;  // AST file the spans refer to

  static auto FromDiagnostic(Diagnostic diag, std::string file)
      -> CompilationError;

  void Print() const;
};

// File name up to the first dot: "hello.ast.yaml" -> "hello". Names the
// module and every build artifact.
auto ProgramStem(const std::filesystem::path& ast_path) -> std::string;

// Load the AST, resolve extern modules and lower to an LLVM module.
// Resolver warnings are printed as they are produced.
auto CompileToLlvm(const CompilationInput& input, VerboseLogger& vlog)
    -> std::expected<CompilationResult, CompilationError>;

}  // namespace arx::driver
