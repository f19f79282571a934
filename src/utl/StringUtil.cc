#include "utl/StringUtil.hh"

#include <fmt/format.h>

#include <cctype>
#include <charconv>

namespace tuslice {
namespace {
std::optional<uint64_t> parse_base(std::string_view text, int base) {
  if (text.empty()) {
    return std::nullopt;
  }
  uint64_t ret = 0;
  auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), ret, base);
  if (ec != std::errc() || end != text.data() + text.size()) {
    return std::nullopt;
  }
  return ret;
}

bool has_hex_prefix(std::string_view text) {
  return text.size() > 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X');
}
}  // namespace

std::string_view trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
    text.remove_suffix(1);
  }
  return text;
}

std::vector<std::string> split_list(std::string_view text, char sep) {
  std::vector<std::string> ret;
  while (!text.empty()) {
    size_t split = text.find(sep);
    std::string_view piece = trim(text.substr(0, split));
    if (!piece.empty()) {
      ret.emplace_back(piece);
    }
    if (split == std::string_view::npos) {
      break;
    }
    text.remove_prefix(split + 1);
  }
  return ret;
}

std::optional<uint64_t> parse_hex(std::string_view text) {
  text = trim(text);
  if (has_hex_prefix(text)) {
    text.remove_prefix(2);
  }
  return parse_base(text, 16);
}

std::optional<uint64_t> parse_number(std::string_view text) {
  text = trim(text);
  if (has_hex_prefix(text)) {
    return parse_base(text.substr(2), 16);
  }
  return parse_base(text, 10);
}

std::string format_address(uint64_t address) { return fmt::format("0x{:x}", address); }
}  // namespace tuslice
