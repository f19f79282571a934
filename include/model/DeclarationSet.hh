#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "model/DecompRecord.hh"
#include "model/TypeGraph.hh"
#include "utl/OrderedTable.hh"

namespace tuslice {
enum class EntryState {
  // Inserted before its children were visited
  kPending,
  kResolved,
};

struct GlobalDecl {
  std::string _name;
  TypeId _type;
  Qualifiers _quals;
  std::optional<uint64_t> _address;
};

// Declaration-only entry for a function referenced but not emitted with a body
struct FunctionDecl {
  std::string _name;
  // Normalized prototype ending in ';', empty when none could be obtained
  std::string _signature;
  TypeId _proto;
  std::optional<uint64_t> _address;
};

struct EquateDecl {
  std::string _name;
  std::string _value;
};

// Everything a set of function bodies needs declared, each category keyed by identity and kept in
// first-discovery order
struct DeclarationSet {
  OrderedTable<TypeId, EntryState> _types;
  OrderedTable<std::string, GlobalDecl> _globals;
  OrderedTable<std::string, FunctionDecl> _functions;
  OrderedTable<std::string, EquateDecl> _equates;

  bool empty() const { return _types.empty() && _globals.empty() && _functions.empty() && _equates.empty(); }
};
}  // namespace tuslice
