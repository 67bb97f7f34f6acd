#include "arx/ast/type.hpp"

#include <optional>
#include <string>
#include <string_view>

#include <fmt/core.h>

namespace arx::ast {

namespace {

auto Trim(std::string_view text) -> std::string_view {
  while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
    text.remove_prefix(1);
  }
  while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
    text.remove_suffix(1);
  }
  return text;
}

}  // namespace

auto ToString(TypeKind kind) -> const char* {
  switch (kind) {
    case TypeKind::kVoid:
      return "void";
    case TypeKind::kInt:
      return "int";
    case TypeKind::kFloat:
      return "float";
    case TypeKind::kBool:
      return "bool";
    case TypeKind::kString:
      return "str";
    case TypeKind::kIntPointer:
      return "int*";
    case TypeKind::kList:
      return "list";
  }
  return "void";
}

auto Type::ToString() const -> std::string {
  if (kind == TypeKind::kList && element != nullptr) {
    return fmt::format("list[{}]", element->ToString());
  }
  return ast::ToString(kind);
}

auto Type::operator==(const Type& other) const -> bool {
  if (kind != other.kind) {
    return false;
  }
  if (kind != TypeKind::kList) {
    return true;
  }
  if (element == nullptr || other.element == nullptr) {
    return true;
  }
  return *element == *other.element;
}

auto ParseType(std::string_view text) -> std::optional<Type> {
  text = Trim(text);
  if (text == "void") {
    return Type::Void();
  }
  if (text == "int") {
    return Type::Int();
  }
  if (text == "float") {
    return Type::Float();
  }
  if (text == "bool") {
    return Type::Bool();
  }
  if (text == "str" || text == "string") {
    return Type::String();
  }
  if (text == "int*") {
    return Type::IntPointer();
  }
  if (text == "list") {
    return Type::UntypedList();
  }
  if (text.starts_with("list[") && text.ends_with("]")) {
    auto inner = text.substr(5, text.size() - 6);
    auto element = ParseType(inner);
    if (!element || element->IsVoid()) {
      return std::nullopt;
    }
    return Type::List(*std::move(element));
  }
  return std::nullopt;
}

}  // namespace arx::ast
