#pragma once

#include <string>
#include <vector>

#include "arx/common/diagnostic.hpp"

namespace arx::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);

// Primary item plus notes. `file` names the AST file spans refer to; pass an
// empty string when the diagnostic has no source file.
void PrintDiagnostic(const Diagnostic& diag, const std::string& file = {});

// Print each diagnostic followed by an "N warnings and M errors" summary.
void PrintDiagnostics(
    const std::vector<Diagnostic>& diags, const std::string& file = {});

}  // namespace arx::driver
