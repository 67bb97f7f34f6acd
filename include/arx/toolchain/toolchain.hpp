#pragma once

#include <expected>
#include <string>
#include <vector>

namespace arx::toolchain {

struct ToolInfo {
  std::string path;
  std::string version;  // First line of `<tool> --version`, may be empty
};

struct ToolchainStatus {
  bool ok;
  std::vector<std::string> errors;
};

// Resolve a tool name (or explicit path) to an executable file.
// Names without a slash are searched on PATH.
auto FindExecutable(const std::string& name) -> std::string;

// Check that the static compiler (llc) is available
auto CheckLlc(const std::string& name = "llc")
    -> std::expected<ToolInfo, std::string>;

// Check that the C++ compiler driver used for extern libraries and linking
// is available
auto CheckCxx(const std::string& name = "c++")
    -> std::expected<ToolInfo, std::string>;

// Run all toolchain checks, return aggregated status
auto CheckToolchain(const std::string& llc, const std::string& cxx)
    -> ToolchainStatus;

}  // namespace arx::toolchain
