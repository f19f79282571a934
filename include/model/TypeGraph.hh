#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace tuslice {
using TypeId = uint32_t;
constexpr TypeId kInvalidTypeId = 0xffffffff;

// Order matches the alternatives of TypeNode
enum class TypeKind {
  kPrimitive,
  kPointer,
  kArray,
  kTypedef,
  kComposite,
  kFunction,
  kEnum,
  kOpaque,
};

enum class CompositeKind { kStruct, kUnion };

///////////
// Nodes //
///////////
struct PrimitiveType {
  std::string _name;
  uint32_t _size;
  bool _signed;
  bool _floating;
};

struct PointerType {
  TypeId _to;
};

struct ArrayType {
  TypeId _of;
  // Zero for flexible/unknown length
  uint64_t _length;
};

struct TypedefType {
  std::string _name;
  TypeId _alias;
};

struct CompositeField {
  std::string _name;
  TypeId _type;
};

struct CompositeType {
  CompositeKind _ckind;
  std::string _name;
  std::vector<CompositeField> _fields;
  // Undefined composites are only ever forward declared
  bool _defined;
};

struct FunctionType {
  TypeId _ret;
  std::vector<TypeId> _params;
  bool _varargs;
};

struct EnumMember {
  std::string _name;
  int64_t _value;
};

struct EnumType {
  std::string _name;
  uint32_t _size;
  std::vector<EnumMember> _members;
};

// Stand-in for a type the decompiler could not describe
struct OpaqueType {
  std::string _name;
  uint32_t _size;
};

using TypeNode =
  std::variant<PrimitiveType, PointerType, ArrayType, TypedefType, CompositeType, FunctionType, EnumType, OpaqueType>;

// Interning arena of type nodes. Structural types (pointer, array, function) are keyed by their
// children, nominal types (composite, typedef, enum, opaque, primitive) by kind and name, so two
// references to the same type always produce the same TypeId and cycles go through names.
class TypeGraph {
private:
  std::vector<TypeNode> _nodes;
  std::vector<std::string> _keys;
  std::unordered_map<std::string, TypeId> _by_key;

private:
  TypeId intern(std::string&& key, TypeNode&& node);
  TypeId lookup_key(std::string const& key) const;

public:
  TypeId primitive(std::string_view name, uint32_t size, bool is_signed, bool floating);
  TypeId pointer_to(TypeId to);
  TypeId array_of(TypeId of, uint64_t length);
  TypeId function(TypeId ret, std::vector<TypeId> const& params, bool varargs);
  TypeId opaque(std::string_view name, uint32_t size);

  // Nominal types are declared first and completed later, which is what lets them be cyclic
  TypeId declare_composite(CompositeKind ckind, std::string_view name);
  void define_composite(TypeId id, std::vector<CompositeField>&& fields);
  TypeId declare_typedef(std::string_view name);
  void define_typedef(TypeId id, TypeId alias);
  TypeId declare_enum(std::string_view name, uint32_t size);
  void define_enum(TypeId id, std::vector<EnumMember>&& members);

  // Typedef, then composite, then enum, then opaque, then primitive
  TypeId find_named(std::string_view name) const;
  TypeId find_composite(CompositeKind ckind, std::string_view name) const;
  TypeId find_enum(std::string_view name) const;

  TypeNode const& node(TypeId id) const { return _nodes[id]; }
  TypeKind kind(TypeId id) const { return static_cast<TypeKind>(_nodes[id].index()); }
  template <typename T>
  T const& as(TypeId id) const {
    return std::get<T>(_nodes[id]);
  }

  // Identity key, stable for the lifetime of the graph
  std::string const& key(TypeId id) const { return _keys[id]; }
  // Name of a nominal type, empty for structural types
  std::string_view name(TypeId id) const;

  bool valid(TypeId id) const { return id < _nodes.size(); }
  size_t size() const { return _nodes.size(); }
};

std::string_view type_kind_str(TypeKind kind);
}  // namespace tuslice
