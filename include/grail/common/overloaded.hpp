#pragma once

namespace grail {

// Visitor helper for std::visit with multiple lambdas.
//
// Usage:
//   std::visit(Overloaded{
//       [](const Traverse& t) { ... },
//       [](const Filter& f) { ... },
//   }, block.data);
//
// Every lowering pass matches blocks and expressions through this helper, so
// adding a new variant alternative fails to compile until each pass handles
// it (or explicitly opts into a generic `const auto&` arm).

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};

// Deduction guide (required in C++17, optional in C++20)
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

}  // namespace grail
