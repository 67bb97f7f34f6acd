#include "arx/toolchain/toolchain.hpp"

#include <cstdlib>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>
#include <unistd.h>

#include <fmt/core.h>

#include "arx/common/subprocess.hpp"

namespace arx::toolchain {

namespace {

auto IsExecutableFile(const std::filesystem::path& path) -> bool {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec) &&
         access(path.c_str(), X_OK) == 0;
}

auto QueryVersion(const std::string& path) -> std::string {
  auto result = common::RunSubprocess({path, "--version"});
  if (result.exit_code != 0) {
    return "";
  }
  auto newline = result.output.find('\n');
  return result.output.substr(0, newline);
}

auto CheckTool(const std::string& name, std::string_view role)
    -> std::expected<ToolInfo, std::string> {
  auto path = FindExecutable(name);
  if (path.empty()) {
    return std::unexpected(
        fmt::format("{} '{}' not found in PATH", role, name));
  }
  return ToolInfo{.path = path, .version = QueryVersion(path)};
}

}  // namespace

auto FindExecutable(const std::string& name) -> std::string {
  if (name.empty()) {
    return "";
  }
  if (name.find('/') != std::string::npos) {
    return IsExecutableFile(name) ? name : "";
  }

  const char* path_env = std::getenv("PATH");
  if (path_env == nullptr) {
    return "";
  }
  std::string_view remaining(path_env);
  while (true) {
    auto colon = remaining.find(':');
    auto dir = remaining.substr(0, colon);
    if (!dir.empty()) {
      auto candidate = std::filesystem::path(dir) / name;
      if (IsExecutableFile(candidate)) {
        return candidate.string();
      }
    }
    if (colon == std::string_view::npos) {
      break;
    }
    remaining.remove_prefix(colon + 1);
  }
  return "";
}

auto CheckLlc(const std::string& name)
    -> std::expected<ToolInfo, std::string> {
  return CheckTool(name, "static compiler");
}

auto CheckCxx(const std::string& name)
    -> std::expected<ToolInfo, std::string> {
  return CheckTool(name, "C++ compiler");
}

auto CheckToolchain(const std::string& llc, const std::string& cxx)
    -> ToolchainStatus {
  ToolchainStatus status{.ok = true, .errors = {}};

  if (auto info = CheckLlc(llc); !info) {
    status.ok = false;
    status.errors.push_back(info.error());
  }

  if (auto info = CheckCxx(cxx); !info) {
    status.ok = false;
    status.errors.push_back(info.error());
  }

  return status;
}

}  // namespace arx::toolchain
