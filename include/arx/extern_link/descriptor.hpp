#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "arx/common/diagnostic.hpp"
#include "arx/extern_link/type_tag.hpp"

namespace arx::extern_link {

struct ExternTarget {
  std::string symbol;
  TypeTag return_tag = TypeTag::kVoid;

  auto operator==(const ExternTarget&) const -> bool = default;
};

// One `name[:tag,...] = symbol > return` line of a [functions] section.
struct DescriptorEntry {
  std::string function;
  ArgumentTags argument_tags;
  ExternTarget target;
  uint32_t line = 0;
};

// Parsed `.map` file.
struct Descriptor {
  std::string module_name;
  std::vector<DescriptorEntry> entries;
  std::string origin;  // File path, for diagnostics
};

// Parse descriptor text. `origin` names the source in error messages.
// Malformed entries and missing [meta] name are descriptor errors.
auto ParseDescriptor(std::string_view text, const std::string& origin)
    -> Result<Descriptor>;

auto LoadDescriptorFile(const std::filesystem::path& path)
    -> Result<Descriptor>;

}  // namespace arx::extern_link
