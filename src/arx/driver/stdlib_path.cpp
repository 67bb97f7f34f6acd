#include "stdlib_path.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

#include <fmt/core.h>

namespace arx::driver {

namespace {

namespace fs = std::filesystem;

auto IsStdlibDir(const fs::path& dir) -> bool {
  std::error_code ec;
  return fs::is_directory(dir / "maps", ec);
}

}  // namespace

auto FindStdlibDir(std::vector<std::string>& tried_paths) -> fs::path {
  // 1. ARX_STDLIB_PATH environment variable
  if (const char* env_path = std::getenv("ARX_STDLIB_PATH")) {
    if (IsStdlibDir(env_path)) {
      return env_path;
    }
    tried_paths.emplace_back(fmt::format("ARX_STDLIB_PATH={}", env_path));
  }

  // 2-3. Relative to executable
  fs::path exe_path;
  try {
    exe_path = fs::read_symlink("/proc/self/exe");
  } catch (const fs::filesystem_error& e) {
    tried_paths.emplace_back(
        fmt::format(
            "/proc/self/exe ({}; non-Linux or sandboxed?)",
            e.code().message()));
  }

  if (!exe_path.empty()) {
    auto installed = exe_path.parent_path().parent_path() / "share" / "arx";
    tried_paths.push_back(installed.string());
    if (IsStdlibDir(installed)) {
      return installed;
    }

    auto sibling = exe_path.parent_path() / "stdlib";
    tried_paths.push_back(sibling.string());
    if (IsStdlibDir(sibling)) {
      return sibling;
    }
  }

#ifdef ARX_SOURCE_STDLIB_DIR
  // 4. Source tree
  fs::path source_dir = ARX_SOURCE_STDLIB_DIR;
  tried_paths.push_back(source_dir.string());
  if (IsStdlibDir(source_dir)) {
    return source_dir;
  }
#endif

  // 5. Current working directory
  auto cwd_path = fs::current_path() / "stdlib";
  tried_paths.push_back(cwd_path.string());
  if (IsStdlibDir(cwd_path)) {
    return cwd_path;
  }

  return {};
}

}  // namespace arx::driver
