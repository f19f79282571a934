#pragma once

#include <type_traits>

namespace tuslice {
template <typename T>
constexpr T bit_or(T lhs, T rhs) {
  using PrimType = std::underlying_type_t<T>;
  return static_cast<T>(static_cast<PrimType>(lhs) | static_cast<PrimType>(rhs));
}

template <typename T>
constexpr T bit_and(T lhs, T rhs) {
  using PrimType = std::underlying_type_t<T>;
  return static_cast<T>(static_cast<PrimType>(lhs) & static_cast<PrimType>(rhs));
}

template <typename T>
constexpr T bit_xor(T lhs, T rhs) {
  using PrimType = std::underlying_type_t<T>;
  return static_cast<T>(static_cast<PrimType>(lhs) ^ static_cast<PrimType>(rhs));
}

template <typename T>
constexpr T bit_not(T flags) {
  return bit_xor(flags, T::kAll);
}

// True if any flag of `against` is set in `check`
template <typename T>
constexpr bool check_flags(T check, T against) {
  return bit_and(bit_and(check, against), T::kAll) != T::kNone;
}
}  // namespace tuslice

#define GEN_FLAG_OPERATORS(EnumType)                                                                \
  constexpr EnumType operator|(EnumType lhs, EnumType rhs) { return ::tuslice::bit_or(lhs, rhs); }  \
  constexpr EnumType operator&(EnumType lhs, EnumType rhs) { return ::tuslice::bit_and(lhs, rhs); } \
  constexpr EnumType operator^(EnumType lhs, EnumType rhs) { return ::tuslice::bit_xor(lhs, rhs); } \
  constexpr EnumType operator~(EnumType flags) { return ::tuslice::bit_not(flags); }
