#include "model/TypeGraph.hh"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include "utl/VariantOverloaded.hh"

namespace tuslice {
namespace {
std::string_view composite_prefix(CompositeKind ckind) { return ckind == CompositeKind::kStruct ? "struct" : "union"; }
}  // namespace

TypeId TypeGraph::intern(std::string&& key, TypeNode&& node) {
  auto it = _by_key.find(key);
  if (it != _by_key.end()) {
    return it->second;
  }

  TypeId id = static_cast<TypeId>(_nodes.size());
  _nodes.push_back(std::move(node));
  _keys.push_back(key);
  _by_key.emplace(std::move(key), id);
  return id;
}

TypeId TypeGraph::lookup_key(std::string const& key) const {
  auto it = _by_key.find(key);
  return it == _by_key.end() ? kInvalidTypeId : it->second;
}

TypeId TypeGraph::primitive(std::string_view name, uint32_t size, bool is_signed, bool floating) {
  return intern(fmt::format("prim:{}", name), PrimitiveType{std::string(name), size, is_signed, floating});
}

TypeId TypeGraph::pointer_to(TypeId to) { return intern(fmt::format("ptr:{}", to), PointerType{to}); }

TypeId TypeGraph::array_of(TypeId of, uint64_t length) {
  return intern(fmt::format("arr:{}:{}", of, length), ArrayType{of, length});
}

TypeId TypeGraph::function(TypeId ret, std::vector<TypeId> const& params, bool varargs) {
  std::string key = fmt::format("fn:{}({}{})", ret, fmt::join(params, ","), varargs ? ",..." : "");
  return intern(std::move(key), FunctionType{ret, params, varargs});
}

TypeId TypeGraph::opaque(std::string_view name, uint32_t size) {
  return intern(fmt::format("opaque:{}", name), OpaqueType{std::string(name), size});
}

TypeId TypeGraph::declare_composite(CompositeKind ckind, std::string_view name) {
  return intern(fmt::format("{}:{}", composite_prefix(ckind), name), CompositeType{ckind, std::string(name), {}, false});
}

void TypeGraph::define_composite(TypeId id, std::vector<CompositeField>&& fields) {
  CompositeType& ct = std::get<CompositeType>(_nodes[id]);
  ct._fields = std::move(fields);
  ct._defined = true;
}

TypeId TypeGraph::declare_typedef(std::string_view name) {
  return intern(fmt::format("typedef:{}", name), TypedefType{std::string(name), kInvalidTypeId});
}

void TypeGraph::define_typedef(TypeId id, TypeId alias) { std::get<TypedefType>(_nodes[id])._alias = alias; }

TypeId TypeGraph::declare_enum(std::string_view name, uint32_t size) {
  return intern(fmt::format("enum:{}", name), EnumType{std::string(name), size, {}});
}

void TypeGraph::define_enum(TypeId id, std::vector<EnumMember>&& members) {
  std::get<EnumType>(_nodes[id])._members = std::move(members);
}

TypeId TypeGraph::find_named(std::string_view name) const {
  for (std::string_view prefix : {"typedef", "struct", "union", "enum", "opaque", "prim"}) {
    TypeId id = lookup_key(fmt::format("{}:{}", prefix, name));
    if (id != kInvalidTypeId) {
      return id;
    }
  }
  return kInvalidTypeId;
}

TypeId TypeGraph::find_composite(CompositeKind ckind, std::string_view name) const {
  return lookup_key(fmt::format("{}:{}", composite_prefix(ckind), name));
}

TypeId TypeGraph::find_enum(std::string_view name) const { return lookup_key(fmt::format("enum:{}", name)); }

std::string_view TypeGraph::name(TypeId id) const {
  return std::visit(overloaded{
                      [](PrimitiveType const& t) { return std::string_view(t._name); },
                      [](TypedefType const& t) { return std::string_view(t._name); },
                      [](CompositeType const& t) { return std::string_view(t._name); },
                      [](EnumType const& t) { return std::string_view(t._name); },
                      [](OpaqueType const& t) { return std::string_view(t._name); },
                      [](auto const&) { return std::string_view(); },
                    },
    _nodes[id]);
}

std::string_view type_kind_str(TypeKind kind) {
  switch (kind) {
    case TypeKind::kPrimitive:
      return "primitive";
    case TypeKind::kPointer:
      return "pointer";
    case TypeKind::kArray:
      return "array";
    case TypeKind::kTypedef:
      return "typedef";
    case TypeKind::kComposite:
      return "composite";
    case TypeKind::kFunction:
      return "function";
    case TypeKind::kEnum:
      return "enum";
    case TypeKind::kOpaque:
      return "opaque";
  }
  return "invalid";
}
}  // namespace tuslice
