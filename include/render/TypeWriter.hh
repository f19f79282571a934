#pragma once

#include <string>
#include <string_view>

#include "model/TypeGraph.hh"
#include "render/FormatPrinter.hh"

namespace tuslice {
// Names C understands without any declaration
bool is_native_c_type(std::string_view name);

// Decompiler pseudo-types covered by the built-in prelude
bool is_prelude_type(std::string_view name);

// Typedefs for the decompiler's pseudo-types, always safe to emit
void write_prelude(FormatPrinter& printer);

// Renders declarations of types out of a TypeGraph. Every nominal type is referred to by its bare
// name, composites rely on a `typedef struct X X;` forward declaration to make that legal.
class TypeWriter {
private:
  TypeGraph const& _graph;

public:
  explicit TypeWriter(TypeGraph const& graph) : _graph(graph) {}

  // C declarator of `inner` with type `id`, e.g. declare(int(*)[4], "p") gives "int (*p)[4]"
  std::string declare(TypeId id, std::string_view inner) const;
  std::string type_name(TypeId id) const { return declare(id, ""); }

  // Each write_* emits nothing when the type needs no declaration of that form
  void write_primitive(TypeId id, FormatPrinter& printer) const;
  void write_opaque(TypeId id, FormatPrinter& printer) const;
  void write_forward(TypeId id, FormatPrinter& printer) const;
  void write_enum(TypeId id, FormatPrinter& printer) const;
  void write_typedef(TypeId id, FormatPrinter& printer) const;
  void write_composite(TypeId id, FormatPrinter& printer) const;

  // A typedef whose name is already provided by the composite or enum it aliases
  bool is_redundant_typedef(TypeId id) const;
};
}  // namespace tuslice
