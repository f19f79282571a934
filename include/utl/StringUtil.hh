#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tuslice {
std::string_view trim(std::string_view text);

// Splits on `sep`, trims every piece and drops empty ones
std::vector<std::string> split_list(std::string_view text, char sep = ',');

// Hex number with an optional 0x/0X prefix, nothing else allowed
std::optional<uint64_t> parse_hex(std::string_view text);

// Accepts hex with a 0x prefix or plain decimal
std::optional<uint64_t> parse_number(std::string_view text);

std::string format_address(uint64_t address);
}  // namespace tuslice
