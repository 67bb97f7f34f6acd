#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace arx::driver {

// Find the bundled standard library: a directory holding `maps/` (extern
// descriptors) and `lib/` (their C++ sources). Returns an empty path if not
// found; populates tried_paths with locations checked. Search order:
//   1. ARX_STDLIB_PATH environment variable
//   2. <exe>/../share/arx (installed layout)
//   3. <exe>/stdlib (build tree)
//   4. Source tree stdlib/ the binary was configured from
//   5. Current working directory
auto FindStdlibDir(std::vector<std::string>& tried_paths)
    -> std::filesystem::path;

}  // namespace arx::driver
