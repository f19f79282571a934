#pragma once

#include <string>
#include <utility>
#include <variant>

// Either a value or the reason it could not be produced
template <typename T>
struct ErrorOr {
  ErrorOr(std::string const& reason) : _val(std::in_place_index<0>, reason) {}
  ErrorOr(std::string&& reason) : _val(std::in_place_index<0>, std::move(reason)) {}
  ErrorOr(char const* reason) : _val(std::in_place_index<0>, std::string(reason)) {}
  ErrorOr(T const& t) : _val(std::in_place_index<1>, t) {}
  ErrorOr(T&& t) : _val(std::in_place_index<1>, std::move(t)) {}

  std::variant<std::string, T> _val;

  constexpr bool is_error() const { return _val.index() == 0; }
  constexpr explicit operator bool() const { return !is_error(); }
  std::string const& err() const { return std::get<0>(_val); }
  T& val() { return std::get<1>(_val); }
  T const& val() const { return std::get<1>(_val); }
  T take() { return std::move(std::get<1>(_val)); }
};
