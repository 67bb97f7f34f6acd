#include "emit.hpp"

#include <fstream>
#include <optional>
#include <string>

#include <fmt/core.h>

#include "arx/lowering/ast_to_llvm/lower.hpp"
#include "pipeline.hpp"
#include "print.hpp"
#include "verbose_logger.hpp"

namespace arx::driver {

auto Emit(
    const CompilationInput& input, const std::optional<std::string>& output)
    -> int {
  VerboseLogger vlog(input.verbosity);

  auto compiled = CompileToLlvm(input, vlog);
  if (!compiled) {
    compiled.error().Print();
    return 1;
  }

  std::string ir = lowering::ast_to_llvm::DumpLlvmIr(compiled->llvm);
  if (!output) {
    fmt::print("{}", ir);
    return 0;
  }

  std::ofstream out(*output);
  if (!out) {
    PrintError(fmt::format("cannot write '{}'", *output));
    return 1;
  }
  out << ir;
  return 0;
}

auto Check(const CompilationInput& input) -> int {
  VerboseLogger vlog(input.verbosity);

  auto compiled = CompileToLlvm(input, vlog);
  if (!compiled) {
    compiled.error().Print();
    return 1;
  }
  vlog.PrintPhaseSummary();
  return 0;
}

}  // namespace arx::driver
