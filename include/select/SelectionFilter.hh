#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "model/DecompRecord.hh"
#include "model/Diagnostics.hh"
#include "utl/ErrorOr.hh"

namespace tuslice {
// Inclusive on both ends
struct AddressRange {
  uint64_t _start;
  uint64_t _end;

  bool contains(uint64_t address) const { return address >= _start && address <= _end; }
};

enum class TagMode {
  // Drop functions carrying any of the tags
  kExclude,
  // Keep only functions carrying at least one of the tags
  kInclude,
};

struct SelectionConfig {
  std::vector<std::string> _names;
  // Comma separated `start-end` items or single addresses, hex
  std::optional<std::string> _address_ranges;
  std::vector<std::string> _tags;
  TagMode _tag_mode = TagMode::kExclude;
  // Treat an unparseable range list as no address constraint instead of failing
  bool _tolerate_bad_ranges = false;
};

struct SelectedFunction {
  uint64_t _address;
  std::string _name;
  // Position in the function listing
  size_t _discovery;
};

using SelectedFunctionSet = std::vector<SelectedFunction>;

ErrorOr<std::vector<AddressRange>> parse_address_ranges(std::string_view text);

// Applies address, tag and name filters in that order. The result is ordered by discovery, then by
// address, and may be empty.
ErrorOr<SelectedFunctionSet> select_functions(std::vector<FunctionInfo> const& universe,
  SelectionConfig const& config,
  Diagnostics& diags);
}  // namespace tuslice
