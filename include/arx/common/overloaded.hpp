#pragma once

namespace arx {

// Visitor helper for std::visit with multiple lambdas.
//
//   std::visit(Overloaded{
//       [](const IntLiteral& lit) { ... },
//       [](const Variable& var) { ... },
//   }, expr.data);
//
// Leaving out a generic `auto` arm keeps the visit exhaustive: adding a new
// variant alternative breaks the build at every dispatch site.
template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace arx
