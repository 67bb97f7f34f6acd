#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "arx/ast/type.hpp"

namespace arx::extern_link {

// Descriptor files describe the foreign ABI with coarse type tags: the kind
// of a source type without list element information.
using TypeTag = ast::TypeKind;
using ArgumentTags = std::vector<TypeTag>;

// int, bool, str/string, float, int*, anything starting with `list`.
// Unrecognized spellings (and `void`) map to void.
auto ParseTypeTag(std::string_view text) -> TypeTag;

auto TagOf(const ast::Type& type) -> TypeTag;

// Source type a return tag stands for. List tags yield the untyped list.
auto TypeFromTag(TypeTag tag) -> ast::Type;

// "int,str" style rendering used in diagnostics
auto FormatTags(const ArgumentTags& tags) -> std::string;

}  // namespace arx::extern_link
