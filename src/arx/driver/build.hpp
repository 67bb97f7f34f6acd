#pragma once

#include <filesystem>

#include "arx/common/diagnostic.hpp"
#include "input.hpp"
#include "pipeline.hpp"
#include "verbose_logger.hpp"

namespace arx::driver {

// Turn a lowered program into a native executable:
//   <out>/build/<stem>.ll   textual IR
//   <out>/build/<stem>.o    llc output
//   <out>/build/<module>.o  one per loaded extern module
//   <out>/bin/<stem>        linked program
// Returns the executable path.
auto BuildExecutable(
    const CompilationInput& input, const CompilationResult& compiled,
    VerboseLogger& vlog) -> Result<std::filesystem::path>;

// Entry point for `arx build`.
auto Build(const CompilationInput& input) -> int;

}  // namespace arx::driver
