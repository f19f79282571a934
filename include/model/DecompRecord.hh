#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "model/TypeGraph.hh"
#include "utl/FlagsEnum.hh"

namespace tuslice {
enum class Qualifiers : uint8_t {
  kNone = 0,
  kAll = 0b11,

  kConst = 1u << 0,
  kVolatile = 1u << 1,
};
GEN_FLAG_OPERATORS(Qualifiers)

enum class GlobalStorage {
  kData,
  // Symbol names a function (address taken in the body), declared as a prototype
  kFunction,
};

struct GlobalRef {
  std::string _name;
  TypeId _type;
  Qualifiers _quals;
  GlobalStorage _storage;
  std::optional<uint64_t> _address;
};

// Direct call out of a decompiled body. Name and signature are what the decompiler inferred at the
// call site and may be empty, in which case the callee's listed prototype is used. The address is
// absent for calls the decompiler could only name.
struct CallRef {
  std::optional<uint64_t> _callee;
  std::string _name;
  std::string _signature;
};

struct EquateRef {
  std::string _name;
  std::string _value;
};

// Decompiler output for one function, immutable once produced
struct DecompRecord {
  uint64_t _address;
  std::string _name;
  std::string _signature;
  TypeId _proto = kInvalidTypeId;
  std::string _body;
  // Every type token met while rendering the body, casts included, in order of appearance
  std::vector<TypeId> _type_refs;
  std::vector<GlobalRef> _globals;
  std::vector<CallRef> _calls;
  std::vector<EquateRef> _equates;
};

// One entry of the function universe
struct FunctionInfo {
  uint64_t _address;
  std::string _name;
  std::vector<std::string> _tags;
  std::string _signature;
  TypeId _proto = kInvalidTypeId;
  bool _external = false;
  std::optional<uint64_t> _thunk_of;
};
}  // namespace tuslice
