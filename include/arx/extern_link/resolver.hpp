#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "arx/common/diagnostic.hpp"
#include "arx/extern_link/descriptor.hpp"
#include "arx/extern_link/type_tag.hpp"

namespace arx::extern_link {

// Overloads of one extern function, keyed by exact argument tag tuple.
using OverloadSet = absl::flat_hash_map<ArgumentTags, ExternTarget>;

// "module.function" -> overload set. Built once by the resolver, read-only
// during lowering.
class OverloadTable {
 public:
  // Returns true when an existing entry with the same key was replaced.
  auto Insert(
      const std::string& qualified_name, const ArgumentTags& tags,
      ExternTarget target) -> bool;

  // nullptr when no function of that name was loaded.
  [[nodiscard]] auto Find(const std::string& qualified_name) const
      -> const OverloadSet*;

  [[nodiscard]] auto FunctionCount() const -> std::size_t {
    return functions_.size();
  }

 private:
  absl::flat_hash_map<std::string, OverloadSet> functions_;
};

struct ResolverInput {
  std::vector<std::filesystem::path> search_dirs;
  std::vector<std::string> requested_modules;  // `core` is always implied
};

struct LinkResult {
  OverloadTable table;
  std::vector<std::string> loaded_modules;  // In load order
  std::vector<Diagnostic> warnings;
};

// Scan each search directory (non-recursively, `.map` files in name order),
// keep the descriptors for `core` and the requested modules, and merge their
// entries. Later entries with the same key win and produce a warning. Any
// unreadable or malformed descriptor, or a requested module that no
// directory provides, fails the whole resolution.
auto ResolveExternModules(const ResolverInput& input) -> Result<LinkResult>;

}  // namespace arx::extern_link
