#include "closure/TypeClosure.hh"

#include <fmt/format.h>

#include "utl/VariantOverloaded.hh"

namespace tuslice {
namespace {
void visit_type(TypeGraph const& graph, TypeId id, OrderedTable<TypeId, EntryState>& acc, Diagnostics& diags);

void check_field(TypeGraph const& graph, CompositeType const& ct, CompositeField const& field, Diagnostics& diags) {
  TypeId base = underlying_type(graph, field._type);
  if (base == kInvalidTypeId) {
    diags.warn(DiagKind::kOpaqueType, ct._name, fmt::format("field '{}' has no type", field._name));
  } else if (graph.kind(base) == TypeKind::kOpaque) {
    diags.warn(DiagKind::kOpaqueType,
      ct._name,
      fmt::format("field '{}' uses unresolved type '{}', emitted as a placeholder", field._name, graph.name(base)));
  }
}

void visit_children(TypeGraph const& graph, TypeId id, OrderedTable<TypeId, EntryState>& acc, Diagnostics& diags) {
  std::visit(overloaded{
               [&](PointerType const& t) { visit_type(graph, t._to, acc, diags); },
               [&](ArrayType const& t) { visit_type(graph, t._of, acc, diags); },
               [&](TypedefType const& t) { visit_type(graph, t._alias, acc, diags); },
               [&](CompositeType const& t) {
                 for (CompositeField const& field : t._fields) {
                   check_field(graph, t, field, diags);
                   visit_type(graph, field._type, acc, diags);
                 }
               },
               [&](FunctionType const& t) {
                 visit_type(graph, t._ret, acc, diags);
                 for (TypeId param : t._params) {
                   visit_type(graph, param, acc, diags);
                 }
               },
               // Enums, primitives and opaque types are leaves
               [](auto const&) {},
             },
    graph.node(id));
}

void visit_type(TypeGraph const& graph, TypeId id, OrderedTable<TypeId, EntryState>& acc, Diagnostics& diags) {
  if (!graph.valid(id)) {
    return;
  }
  // Mark before recursing: a pending entry means this type is already being visited further up
  if (!acc.insert(id, EntryState::kPending)) {
    return;
  }
  visit_children(graph, id, acc, diags);
  *acc.find(id) = EntryState::kResolved;
}
}  // namespace

void close_type(TypeGraph const& graph, TypeId root, OrderedTable<TypeId, EntryState>& acc, Diagnostics& diags) {
  visit_type(graph, root, acc, diags);
}

TypeId underlying_type(TypeGraph const& graph, TypeId id) {
  for (size_t steps = 0; steps <= graph.size(); steps++) {
    if (!graph.valid(id)) {
      return kInvalidTypeId;
    }
    switch (graph.kind(id)) {
      case TypeKind::kPointer:
        id = graph.as<PointerType>(id)._to;
        break;
      case TypeKind::kArray:
        id = graph.as<ArrayType>(id)._of;
        break;
      case TypeKind::kTypedef:
        id = graph.as<TypedefType>(id)._alias;
        break;
      default:
        return id;
    }
  }
  // Typedef loop, nothing underneath
  return kInvalidTypeId;
}
}  // namespace tuslice
