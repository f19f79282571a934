#pragma once

namespace tuslice {
// Visitor built from a set of lambdas, for use with std::visit
template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
}  // namespace tuslice
