#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "arx/ast/arena.hpp"
#include "arx/common/diagnostic.hpp"

namespace arx::ast {

// Load an AST interchange file (YAML) written by the parser front end.
// Malformed documents are reported as host errors carrying the position of
// the offending node.
auto LoadCompilationUnitFromFile(const std::filesystem::path& path)
    -> Result<CompilationUnit>;

auto LoadCompilationUnitFromString(
    std::string_view text, std::string source_path = "<memory>")
    -> Result<CompilationUnit>;

}  // namespace arx::ast
