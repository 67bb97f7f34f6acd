#pragma once

#include <optional>
#include <string>

#include "input.hpp"

namespace arx::driver {

// Lower and print textual LLVM IR to stdout, or to `output` when given.
auto Emit(
    const CompilationInput& input, const std::optional<std::string>& output)
    -> int;

// Lower only; report diagnostics and exit status.
auto Check(const CompilationInput& input) -> int;

}  // namespace arx::driver
