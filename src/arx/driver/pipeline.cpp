#include "pipeline.hpp"

#include <expected>
#include <string>
#include <utility>

#include "arx/ast/yaml_loader.hpp"
#include "arx/common/diagnostic.hpp"
#include "arx/common/diagnostic_sink.hpp"
#include "arx/extern_link/resolver.hpp"
#include "arx/lowering/ast_to_llvm/lower.hpp"
#include "print.hpp"
#include "verbose_logger.hpp"

namespace arx::driver {

auto CompilationError::FromDiagnostic(Diagnostic diag, std::string file)
    -> CompilationError {
  CompilationError error{.diagnostics = {}, .file = std::move(file)};
  error.diagnostics.Report(std::move(diag));
  return error;
}

void CompilationError::Print() const {
  PrintDiagnostics(diagnostics.GetDiagnostics(), file);
}

auto ProgramStem(const std::filesystem::path& ast_path) -> std::string {
  std::string name = ast_path.filename().string();
  auto dot = name.find('.');
  if (dot == 0 || dot == std::string::npos) {
    return name;
  }
  return name.substr(0, dot);
}

auto CompileToLlvm(const CompilationInput& input, VerboseLogger& vlog)
    -> std::expected<CompilationResult, CompilationError> {
  std::string file = input.ast_path.string();

  Result<ast::CompilationUnit> unit;
  {
    PhaseTimer timer(vlog, "load_ast");
    unit = ast::LoadCompilationUnitFromFile(input.ast_path);
  }
  if (!unit) {
    return std::unexpected(
        CompilationError::FromDiagnostic(std::move(unit.error()), file));
  }

  Result<extern_link::LinkResult> link;
  {
    PhaseTimer timer(vlog, "resolve");
    link = extern_link::ResolveExternModules(
        extern_link::ResolverInput{
            .search_dirs = input.map_dirs,
            .requested_modules = unit->program.uses,
        });
  }
  if (!link) {
    return std::unexpected(
        CompilationError::FromDiagnostic(std::move(link.error()), {}));
  }
  for (const auto& warning : link->warnings) {
    PrintDiagnostic(warning);
  }
  if (vlog.Enabled(2)) {
    for (const auto& module : link->loaded_modules) {
      vlog.Detail("resolve", "loaded extern module " + module);
    }
  }

  Result<lowering::ast_to_llvm::LoweringResult> llvm;
  {
    PhaseTimer timer(vlog, "lower");
    llvm = lowering::ast_to_llvm::LowerAstToLlvm(
        lowering::ast_to_llvm::LoweringInput{
            .unit = &*unit,
            .externs = &link->table,
            .module_name = ProgramStem(input.ast_path),
            .target_triple = {},
        });
  }
  if (!llvm) {
    return std::unexpected(
        CompilationError::FromDiagnostic(std::move(llvm.error()), file));
  }

  return CompilationResult{
      .unit = std::move(*unit),
      .link = std::move(*link),
      .llvm = std::move(*llvm),
  };
}

}  // namespace arx::driver
