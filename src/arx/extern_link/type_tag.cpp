#include "arx/extern_link/type_tag.hpp"

#include <string>
#include <string_view>

#include <fmt/format.h>

#include "arx/ast/type.hpp"

namespace arx::extern_link {

auto ParseTypeTag(std::string_view text) -> TypeTag {
  if (text == "int") {
    return TypeTag::kInt;
  }
  if (text == "bool") {
    return TypeTag::kBool;
  }
  if (text == "str" || text == "string") {
    return TypeTag::kString;
  }
  if (text == "float") {
    return TypeTag::kFloat;
  }
  if (text == "int*") {
    return TypeTag::kIntPointer;
  }
  if (text.starts_with("list")) {
    return TypeTag::kList;
  }
  return TypeTag::kVoid;
}

auto TagOf(const ast::Type& type) -> TypeTag {
  return type.kind;
}

auto TypeFromTag(TypeTag tag) -> ast::Type {
  switch (tag) {
    case TypeTag::kVoid:
      return ast::Type::Void();
    case TypeTag::kInt:
      return ast::Type::Int();
    case TypeTag::kFloat:
      return ast::Type::Float();
    case TypeTag::kBool:
      return ast::Type::Bool();
    case TypeTag::kString:
      return ast::Type::String();
    case TypeTag::kIntPointer:
      return ast::Type::IntPointer();
    case TypeTag::kList:
      return ast::Type::UntypedList();
  }
  return ast::Type::Void();
}

auto FormatTags(const ArgumentTags& tags) -> std::string {
  std::string out;
  for (const auto& tag : tags) {
    if (!out.empty()) {
      out += ',';
    }
    out += ast::ToString(tag);
  }
  return out;
}

}  // namespace arx::extern_link
