#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace arx::ast {

enum class TypeKind : uint8_t {
  kVoid,
  kInt,         // 32-bit signed
  kFloat,       // IEEE double
  kBool,        // 1-bit
  kString,      // NUL-terminated byte pointer
  kIntPointer,  // Pointer to 32-bit signed
  kList,        // Pointer to a list record
};

auto ToString(TypeKind kind) -> const char*;

// Static type of a source-level value. List types carry their element type;
// a list with no element (`list`, e.g. returned from an extern call) is
// compatible with every list type.
struct Type {
  TypeKind kind = TypeKind::kVoid;
  std::shared_ptr<const Type> element;

  static auto Void() -> Type {
    return Type{.kind = TypeKind::kVoid, .element = nullptr};
  }
  static auto Int() -> Type {
    return Type{.kind = TypeKind::kInt, .element = nullptr};
  }
  static auto Float() -> Type {
    return Type{.kind = TypeKind::kFloat, .element = nullptr};
  }
  static auto Bool() -> Type {
    return Type{.kind = TypeKind::kBool, .element = nullptr};
  }
  static auto String() -> Type {
    return Type{.kind = TypeKind::kString, .element = nullptr};
  }
  static auto IntPointer() -> Type {
    return Type{.kind = TypeKind::kIntPointer, .element = nullptr};
  }
  static auto List(Type element_type) -> Type {
    return Type{
        .kind = TypeKind::kList,
        .element = std::make_shared<const Type>(std::move(element_type))};
  }
  static auto UntypedList() -> Type {
    return Type{.kind = TypeKind::kList, .element = nullptr};
  }

  [[nodiscard]] auto IsVoid() const -> bool {
    return kind == TypeKind::kVoid;
  }
  [[nodiscard]] auto IsList() const -> bool {
    return kind == TypeKind::kList;
  }
  [[nodiscard]] auto HasElement() const -> bool {
    return element != nullptr;
  }

  // str, int* and lists are stored in list slots as pointers.
  [[nodiscard]] auto IsPointerShaped() const -> bool {
    return kind == TypeKind::kString || kind == TypeKind::kIntPointer ||
           kind == TypeKind::kList;
  }

  [[nodiscard]] auto ToString() const -> std::string;

  auto operator==(const Type& other) const -> bool;
};

// Parse a type spelling: void, int, float, bool, str (or string), int*,
// list, list[T]. Returns nullopt for anything else.
auto ParseType(std::string_view text) -> std::optional<Type>;

}  // namespace arx::ast
