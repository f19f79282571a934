#pragma once

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <string_view>
#include <utility>

namespace tuslice {
// Line oriented writer that indents each line at the current level
class FormatPrinter {
  std::ostream& _sink;
  const int _tabsz;
  int _tablv;
  bool _needs_tab;

public:
  FormatPrinter(std::ostream& sink, int tabsz) : _sink(sink), _tabsz(tabsz), _tablv(0), _needs_tab(false) {}

  template <typename T>
  void write(T&& v) {
    if (_needs_tab) {
      _sink << std::setw(_tablv) << "";
      _needs_tab = false;
    }
    _sink << std::forward<T>(v);
  }

  void linebreak() {
    _sink << "\n";
    _needs_tab = true;
  }

  template <typename T>
  void line(T&& v) {
    write(std::forward<T>(v));
    linebreak();
  }

  // Copies preformatted text as is, ending it with a newline if it lacks one
  void write_block(std::string_view text) {
    if (text.empty()) {
      return;
    }
    _sink << text;
    if (text.back() != '\n') {
      _sink << "\n";
    }
    _needs_tab = true;
  }

  void indent() { _tablv += _tabsz; }

  void unindent() { _tablv = std::max(_tablv - _tabsz, 0); }
};
}  // namespace tuslice
