#include "arx/extern_link/resolver.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>

#include "arx/common/diagnostic.hpp"
#include "arx/common/diagnostic_sink.hpp"
#include "arx/extern_link/descriptor.hpp"
#include "arx/extern_link/type_tag.hpp"

namespace arx::extern_link {

namespace {

constexpr const char* kCoreModule = "core";

auto ListDescriptorFiles(const std::filesystem::path& dir, DiagnosticSink& sink)
    -> std::vector<std::filesystem::path> {
  std::vector<std::filesystem::path> files;
  std::error_code ec;
  if (!std::filesystem::is_directory(dir, ec)) {
    sink.Warning(
        fmt::format("descriptor directory '{}' does not exist", dir.string()));
    return files;
  }
  for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
    if (entry.is_regular_file() && entry.path().extension() == ".map") {
      files.push_back(entry.path());
    }
  }
  std::ranges::sort(files);
  return files;
}

}  // namespace

auto OverloadTable::Insert(
    const std::string& qualified_name, const ArgumentTags& tags,
    ExternTarget target) -> bool {
  auto& overloads = functions_[qualified_name];
  auto [it, inserted] = overloads.insert_or_assign(tags, std::move(target));
  return !inserted;
}

auto OverloadTable::Find(const std::string& qualified_name) const
    -> const OverloadSet* {
  auto it = functions_.find(qualified_name);
  if (it == functions_.end()) {
    return nullptr;
  }
  return &it->second;
}

auto ResolveExternModules(const ResolverInput& input) -> Result<LinkResult> {
  LinkResult result;
  DiagnosticSink sink;

  auto is_wanted = [&](const std::string& module) {
    return module == kCoreModule ||
           std::ranges::find(input.requested_modules, module) !=
               input.requested_modules.end();
  };

  for (const auto& dir : input.search_dirs) {
    for (const auto& path : ListDescriptorFiles(dir, sink)) {
      auto descriptor = LoadDescriptorFile(path);
      if (!descriptor) {
        return std::unexpected(std::move(descriptor).error());
      }
      if (!is_wanted(descriptor->module_name)) {
        continue;
      }

      const auto& module = descriptor->module_name;
      if (std::ranges::find(result.loaded_modules, module) ==
          result.loaded_modules.end()) {
        result.loaded_modules.push_back(module);
      }

      for (auto& entry : descriptor->entries) {
        auto qualified = fmt::format("{}.{}", module, entry.function);
        bool replaced =
            result.table.Insert(qualified, entry.argument_tags, entry.target);
        if (replaced) {
          sink.Warning(
              fmt::format(
                  "{}:{}: '{}({})' overrides an earlier descriptor entry",
                  descriptor->origin, entry.line, qualified,
                  FormatTags(entry.argument_tags)));
        }
      }
    }
  }

  std::vector<std::string> wanted{kCoreModule};
  wanted.insert(
      wanted.end(), input.requested_modules.begin(),
      input.requested_modules.end());
  for (const auto& module : wanted) {
    if (std::ranges::find(result.loaded_modules, module) ==
        result.loaded_modules.end()) {
      std::string searched;
      for (const auto& dir : input.search_dirs) {
        searched += searched.empty() ? "" : ", ";
        searched += dir.string();
      }
      return std::unexpected(
          Diagnostic::HostError(
              ErrorCategory::kDescriptor,
              fmt::format(
                  "extern module '{}' not found (searched: {})", module,
                  searched.empty() ? "<none>" : searched)));
    }
  }

  result.warnings = sink.TakeDiagnostics();
  return result;
}

}  // namespace arx::extern_link
