#pragma once

#include "model/DeclarationSet.hh"
#include "model/Diagnostics.hh"
#include "model/TypeGraph.hh"

namespace tuslice {
// Adds `root` and every type it transitively depends on to `acc`. An entry is inserted as pending
// before its children are visited, so a type reached again through a cycle is skipped rather than
// re-entered. Invalid ids are ignored.
void close_type(TypeGraph const& graph, TypeId root, OrderedTable<TypeId, EntryState>& acc, Diagnostics& diags);

// Strips pointers, arrays and typedefs down to the type that decides what a value is
TypeId underlying_type(TypeGraph const& graph, TypeId id);
}  // namespace tuslice
