#pragma once

#include <string>
#include <vector>

namespace arx::common {

struct ProcessResult {
  int exit_code = -1;
  std::string output;  // Merged stdout and stderr
};

// Run argv[0] with the given arguments, searched on PATH, without a shell.
// Blocks until the child exits. When the child cannot be started the exit
// code is -1 and the output carries the reason.
auto RunSubprocess(const std::vector<std::string>& argv) -> ProcessResult;

}  // namespace arx::common
