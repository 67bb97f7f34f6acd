#include "arx/extern_link/descriptor.hpp"

#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>

#include "arx/common/diagnostic.hpp"
#include "arx/extern_link/type_tag.hpp"

namespace arx::extern_link {

namespace {

enum class Section : uint8_t { kNone, kMeta, kFunctions };

auto Trim(std::string_view text) -> std::string_view {
  while (!text.empty() &&
         std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() &&
         std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

auto IsIdentifier(std::string_view text) -> bool {
  if (text.empty()) {
    return false;
  }
  auto first = static_cast<unsigned char>(text.front());
  if (std::isalpha(first) == 0 && first != '_') {
    return false;
  }
  for (char c : text) {
    auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc) == 0 && uc != '_') {
      return false;
    }
  }
  return true;
}

class DescriptorParser {
 public:
  explicit DescriptorParser(const std::string& origin) : origin_(origin) {
  }

  auto Parse(std::string_view text) -> Result<Descriptor> {
    Descriptor descriptor{.module_name = {}, .entries = {}, .origin = origin_};
    bool saw_meta = false;
    Section section = Section::kNone;

    uint32_t line_number = 0;
    std::size_t pos = 0;
    while (pos <= text.size()) {
      auto newline = text.find('\n', pos);
      auto raw = text.substr(
          pos, newline == std::string_view::npos ? std::string_view::npos
                                                 : newline - pos);
      pos = newline == std::string_view::npos ? text.size() + 1 : newline + 1;
      ++line_number;

      auto line = Trim(raw);
      if (line.empty() || line.front() == '#' || line.front() == ';') {
        continue;
      }

      if (line.front() == '[') {
        if (line.back() != ']') {
          return Error(line_number, "unterminated section header");
        }
        auto name = Trim(line.substr(1, line.size() - 2));
        if (name == "meta") {
          section = Section::kMeta;
          saw_meta = true;
        } else if (name == "functions") {
          section = Section::kFunctions;
        } else {
          return Error(
              line_number, fmt::format("unknown section '[{}]'", name));
        }
        continue;
      }

      auto eq = line.find('=');
      if (eq == std::string_view::npos) {
        return Error(line_number, "expected 'key = value'");
      }
      auto key = Trim(line.substr(0, eq));
      auto value = Trim(line.substr(eq + 1));

      switch (section) {
        case Section::kNone:
          return Error(line_number, "entry outside of any section");
        case Section::kMeta:
          if (key == "name") {
            if (!IsIdentifier(value)) {
              return Error(
                  line_number, fmt::format("invalid module name '{}'", value));
            }
            descriptor.module_name = std::string(value);
          }
          break;
        case Section::kFunctions: {
          auto entry = ParseEntry(key, value, line_number);
          if (!entry) {
            return std::unexpected(std::move(entry).error());
          }
          descriptor.entries.push_back(*std::move(entry));
          break;
        }
      }
    }

    if (!saw_meta) {
      return Error(0, "missing [meta] section");
    }
    if (descriptor.module_name.empty()) {
      return Error(0, "missing 'name' in [meta] section");
    }
    return descriptor;
  }

 private:
  // key:   function[:tag,tag,...]
  // value: symbol > return_tag
  auto ParseEntry(std::string_view key, std::string_view value, uint32_t line)
      -> Result<DescriptorEntry> {
    DescriptorEntry entry{
        .function = {}, .argument_tags = {}, .target = {}, .line = line};

    auto colon = key.find(':');
    auto function = Trim(key.substr(0, colon));
    if (!IsIdentifier(function)) {
      return Error(line, fmt::format("invalid function name '{}'", function));
    }
    entry.function = std::string(function);

    if (colon != std::string_view::npos) {
      auto tags = Trim(key.substr(colon + 1));
      std::size_t start = 0;
      while (!tags.empty() && start <= tags.size()) {
        auto comma = tags.find(',', start);
        auto tag = Trim(tags.substr(
            start, comma == std::string_view::npos ? std::string_view::npos
                                                   : comma - start));
        if (tag.empty()) {
          return Error(
              line,
              fmt::format("empty argument type in '{}'", std::string(key)));
        }
        entry.argument_tags.push_back(ParseTypeTag(tag));
        if (comma == std::string_view::npos) {
          break;
        }
        start = comma + 1;
      }
    }

    auto arrow = value.find('>');
    if (arrow == std::string_view::npos) {
      return Error(
          line, fmt::format(
                    "entry '{}' lacks '> return_type'", std::string(key)));
    }
    auto symbol = Trim(value.substr(0, arrow));
    auto return_tag = Trim(value.substr(arrow + 1));
    if (!IsIdentifier(symbol)) {
      return Error(line, fmt::format("invalid target symbol '{}'", symbol));
    }
    if (return_tag.empty()) {
      return Error(
          line, fmt::format("entry '{}' has an empty return type", key));
    }
    entry.target = ExternTarget{
        .symbol = std::string(symbol), .return_tag = ParseTypeTag(return_tag)};
    return entry;
  }

  [[nodiscard]] auto Error(uint32_t line, std::string msg) const
      -> std::unexpected<Diagnostic> {
    auto where = line == 0 ? origin_ : fmt::format("{}:{}", origin_, line);
    return std::unexpected(
        Diagnostic::HostError(
            ErrorCategory::kDescriptor, fmt::format("{}: {}", where, msg)));
  }

  const std::string& origin_;
};

}  // namespace

auto ParseDescriptor(std::string_view text, const std::string& origin)
    -> Result<Descriptor> {
  DescriptorParser parser(origin);
  return parser.Parse(text);
}

auto LoadDescriptorFile(const std::filesystem::path& path)
    -> Result<Descriptor> {
  std::ifstream file(path);
  if (!file) {
    return std::unexpected(
        Diagnostic::HostError(
            ErrorCategory::kDescriptor,
            fmt::format("cannot read descriptor '{}'", path.string())));
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return ParseDescriptor(buffer.str(), path.string());
}

}  // namespace arx::extern_link
