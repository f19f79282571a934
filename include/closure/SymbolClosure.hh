#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "model/DeclarationSet.hh"
#include "model/DecompRecord.hh"
#include "model/Diagnostics.hh"

namespace tuslice {
// Lookup over the function universe by address and by name
class FunctionIndex {
private:
  std::vector<FunctionInfo> _functions;
  std::unordered_map<uint64_t, size_t> _by_address;
  std::unordered_map<std::string, size_t> _by_name;

public:
  explicit FunctionIndex(std::vector<FunctionInfo> functions);

  FunctionInfo const* by_address(uint64_t address) const;
  FunctionInfo const* by_name(std::string_view name) const;
  // Follows thunk links to the final target. Broken links stop at the last thunk that resolves and
  // loops stop where they close.
  FunctionInfo const* resolve_thunk(FunctionInfo const* fn) const;

  std::vector<FunctionInfo> const& functions() const { return _functions; }
  size_t size() const { return _functions.size(); }
};

struct SymbolContext {
  FunctionIndex const& _index;
  // Functions whose bodies are emitted, never declared as callees
  std::unordered_set<uint64_t> const& _selected;
};

// Trims and terminates a prototype with exactly one ';'. Blank input stays blank.
std::string normalize_signature(std::string_view signature);

std::string missing_signature_comment(std::string_view name);

// Adds the globals, called functions and equates referenced by `record` to `acc`. First sighting of
// a name wins; a later sighting that disagrees is recorded as a conflict.
void close_symbols(DecompRecord const& record, SymbolContext const& ctx, DeclarationSet& acc, Diagnostics& diags);

// Folds `from` into `into` with the same first-sighting rules as close_symbols. Types keep their
// first position.
void merge_declarations(DeclarationSet& into, DeclarationSet const& from, Diagnostics& diags);
}  // namespace tuslice
