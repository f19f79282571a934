#include "select/SelectionFilter.hh"

#include <fmt/format.h>

#include <algorithm>
#include <unordered_set>

#include "utl/StringUtil.hh"

namespace tuslice {
namespace {
ErrorOr<uint64_t> parse_bound(std::string_view item, std::string_view bound) {
  bound = trim(bound);
  if (bound.empty()) {
    return fmt::format("Missing address in range item '{}'", item);
  }
  std::optional<uint64_t> ret = parse_hex(bound);
  if (!ret) {
    return fmt::format("Invalid address '{}' in range item '{}'", bound, item);
  }
  return *ret;
}

bool has_any_tag(FunctionInfo const& fn, std::unordered_set<std::string> const& tags) {
  return std::any_of(fn._tags.begin(), fn._tags.end(), [&tags](std::string const& t) { return tags.contains(t); });
}
}  // namespace

ErrorOr<std::vector<AddressRange>> parse_address_ranges(std::string_view text) {
  std::vector<AddressRange> ret;
  if (trim(text).empty()) {
    return std::string("Address range list is empty");
  }

  size_t pos = 0;
  while (pos <= text.size()) {
    size_t comma = text.find(',', pos);
    std::string_view item = trim(text.substr(pos, comma == std::string_view::npos ? comma : comma - pos));
    if (item.empty()) {
      return fmt::format("Empty item in address range list '{}'", text);
    }

    size_t dash = item.find('-');
    if (dash == std::string_view::npos) {
      ErrorOr<uint64_t> addr = parse_bound(item, item);
      if (addr.is_error()) {
        return addr.err();
      }
      ret.push_back(AddressRange{addr.val(), addr.val()});
    } else {
      ErrorOr<uint64_t> start = parse_bound(item, item.substr(0, dash));
      if (start.is_error()) {
        return start.err();
      }
      ErrorOr<uint64_t> end = parse_bound(item, item.substr(dash + 1));
      if (end.is_error()) {
        return end.err();
      }
      if (start.val() > end.val()) {
        return fmt::format("Reversed address range '{}'", item);
      }
      ret.push_back(AddressRange{start.val(), end.val()});
    }

    if (comma == std::string_view::npos) {
      break;
    }
    pos = comma + 1;
  }
  return ret;
}

ErrorOr<SelectedFunctionSet> select_functions(std::vector<FunctionInfo> const& universe,
  SelectionConfig const& config,
  Diagnostics& diags) {
  std::optional<std::vector<AddressRange>> ranges;
  if (config._address_ranges) {
    ErrorOr<std::vector<AddressRange>> parsed = parse_address_ranges(*config._address_ranges);
    if (parsed.is_error()) {
      if (!config._tolerate_bad_ranges) {
        return parsed.err();
      }
      diags.warn(DiagKind::kBadAddressRange, *config._address_ranges, fmt::format("{}, ignoring", parsed.err()));
    } else {
      ranges = parsed.take();
    }
  }

  std::unordered_set<std::string> tags(config._tags.begin(), config._tags.end());
  for (std::string const& tag : config._tags) {
    bool carried = std::any_of(universe.begin(), universe.end(), [&tag](FunctionInfo const& fn) {
      return std::find(fn._tags.begin(), fn._tags.end(), tag) != fn._tags.end();
    });
    if (!carried) {
      diags.warn(DiagKind::kUnmatchedFilter, tag, "no function carries this tag");
    }
  }

  std::unordered_set<std::string> names(config._names.begin(), config._names.end());
  std::unordered_set<std::string> matched_names;

  SelectedFunctionSet ret;
  for (size_t i = 0; i < universe.size(); i++) {
    FunctionInfo const& fn = universe[i];
    if (ranges &&
        std::none_of(ranges->begin(), ranges->end(), [&fn](AddressRange const& r) { return r.contains(fn._address); }))
    {
      continue;
    }
    if (!tags.empty() && has_any_tag(fn, tags) == (config._tag_mode == TagMode::kExclude)) {
      continue;
    }
    if (!names.empty()) {
      if (!names.contains(fn._name)) {
        continue;
      }
      matched_names.insert(fn._name);
    }
    ret.push_back(SelectedFunction{fn._address, fn._name, i});
  }

  for (std::string const& name : config._names) {
    if (!matched_names.contains(name)) {
      diags.warn(DiagKind::kUnmatchedFilter, name, "no selected function has this name");
    }
  }

  std::stable_sort(ret.begin(), ret.end(), [](SelectedFunction const& a, SelectedFunction const& b) {
    if (a._discovery != b._discovery) {
      return a._discovery < b._discovery;
    }
    return a._address < b._address;
  });
  return ret;
}
}  // namespace tuslice
