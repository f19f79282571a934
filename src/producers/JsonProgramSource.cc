#include "producers/JsonProgramSource.hh"

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

#include "render/TypeWriter.hh"
#include "utl/StringUtil.hh"

namespace tuslice {
namespace {
using nlohmann::json;

struct NativeInfo {
  std::string_view _name;
  uint32_t _size;
  bool _signed;
  bool _floating;
};

// Sizes assumed for C names the database uses without declaring them
constexpr NativeInfo kNativeDefaults[] = {
  {"void", 0, false, false},
  {"char", 1, true, false},
  {"signed char", 1, true, false},
  {"unsigned char", 1, false, false},
  {"short", 2, true, false},
  {"unsigned short", 2, false, false},
  {"int", 4, true, false},
  {"unsigned int", 4, false, false},
  {"unsigned", 4, false, false},
  {"long", 8, true, false},
  {"unsigned long", 8, false, false},
  {"long long", 8, true, false},
  {"unsigned long long", 8, false, false},
  {"float", 4, true, true},
  {"double", 8, true, true},
  {"long double", 16, true, true},
};

// Decompiler pseudo-types, which the output prelude defines
std::optional<NativeInfo> pseudo_type(std::string_view name) {
  if (!is_prelude_type(name)) {
    return std::nullopt;
  }
  if (name == "bool") {
    return NativeInfo{name, 1, false, false};
  }
  for (NativeInfo family : {NativeInfo{"unkbyte", 0, false, false},
         NativeInfo{"unkuint", 0, false, false},
         NativeInfo{"unkint", 0, true, false},
         NativeInfo{"unkfloat", 0, true, true}}) {
    if (name.starts_with(family._name)) {
      std::optional<uint64_t> size = parse_number(name.substr(family._name.size()));
      return NativeInfo{name, static_cast<uint32_t>(size.value_or(0)), family._signed, family._floating};
    }
  }
  // code and BADSPACEBASE stand in for void
  return NativeInfo{name, 0, false, false};
}

std::optional<uint64_t> json_address(json const& value) {
  if (value.is_number_unsigned()) {
    return value.get<uint64_t>();
  } else if (value.is_string()) {
    return parse_hex(value.get<std::string>());
  }
  return std::nullopt;
}

std::string json_text(json const& value) { return value.is_string() ? value.get<std::string>() : value.dump(); }

Qualifiers parse_qualifiers(json const& value) {
  Qualifiers ret = Qualifiers::kNone;
  auto apply = [&ret](std::string const& q) {
    if (q == "const") {
      ret = ret | Qualifiers::kConst;
    } else if (q == "volatile") {
      ret = ret | Qualifiers::kVolatile;
    }
  };

  if (value.is_array()) {
    for (json const& q : value) {
      apply(q.get<std::string>());
    }
  } else if (value.is_string()) {
    for (std::string const& q : split_list(value.get<std::string>(), ' ')) {
      apply(q);
    }
  }
  return ret;
}
}  // namespace

void JsonProgramSource::declare_type(json const& entry, std::unordered_set<std::string>& seen) {
  std::string kind = entry.at("kind").get<std::string>();
  std::string name = entry.at("name").get<std::string>();
  if (!seen.insert(fmt::format("{}:{}", kind == "function" ? "typedef" : kind, name)).second) {
    _load_diags.warn(DiagKind::kDuplicateType, name, fmt::format("{} declared more than once, keeping the first", kind));
    return;
  }

  if (kind == "primitive") {
    _graph.primitive(
      name, entry.value("size", 0u), entry.value("signed", false), entry.value("floating", false));
  } else if (kind == "struct") {
    _graph.declare_composite(CompositeKind::kStruct, name);
  } else if (kind == "union") {
    _graph.declare_composite(CompositeKind::kUnion, name);
  } else if (kind == "enum") {
    _graph.declare_enum(name, entry.value("size", 4u));
  } else if (kind == "typedef" || kind == "function") {
    _graph.declare_typedef(name);
  } else if (kind == "opaque") {
    _graph.opaque(name, entry.value("size", 0u));
  } else {
    _load_diags.warn(DiagKind::kUnknownType, name, fmt::format("unsupported type kind '{}', ignored", kind));
  }
}

void JsonProgramSource::define_type(json const& entry) {
  std::string kind = entry.at("kind").get<std::string>();
  std::string name = entry.at("name").get<std::string>();

  if (kind == "struct" || kind == "union") {
    TypeId id = _graph.find_composite(kind == "struct" ? CompositeKind::kStruct : CompositeKind::kUnion, name);
    // Without a field list the composite stays a forward declaration
    if (!entry.contains("fields") || _graph.as<CompositeType>(id)._defined) {
      return;
    }
    std::vector<CompositeField> fields;
    for (json const& field : entry.at("fields")) {
      fields.push_back(CompositeField{field.value("name", std::string()), resolve_ref(field.at("type"))});
    }
    _graph.define_composite(id, std::move(fields));
  } else if (kind == "enum") {
    TypeId id = _graph.find_enum(name);
    if (!_graph.as<EnumType>(id)._members.empty()) {
      return;
    }
    std::vector<EnumMember> members;
    for (json const& member : entry.value("members", json::array())) {
      members.push_back(EnumMember{member.at("name").get<std::string>(), member.at("value").get<int64_t>()});
    }
    _graph.define_enum(id, std::move(members));
  } else if (kind == "typedef" || kind == "function") {
    TypeId id = _graph.find_named(name);
    if (_graph.kind(id) != TypeKind::kTypedef || _graph.valid(_graph.as<TypedefType>(id)._alias)) {
      return;
    }
    if (kind == "typedef") {
      _graph.define_typedef(id, resolve_ref(entry.at("type")));
    } else {
      std::vector<TypeId> params;
      for (json const& param : entry.value("params", json::array())) {
        params.push_back(resolve_ref(param));
      }
      TypeId ret = resolve_ref(entry.value("return", json("void")));
      _graph.define_typedef(id, _graph.function(ret, params, entry.value("varargs", false)));
    }
  }
}

TypeId JsonProgramSource::resolve_named(std::string_view text) {
  text = trim(text);
  size_t depth = 0;
  while (!text.empty() && text.back() == '*') {
    depth++;
    text = trim(text.substr(0, text.size() - 1));
  }
  if (text.starts_with("const ")) {
    text = trim(text.substr(6));
  }

  std::optional<CompositeKind> ckind;
  bool is_enum = false;
  if (text.starts_with("struct ")) {
    ckind = CompositeKind::kStruct;
    text = trim(text.substr(7));
  } else if (text.starts_with("union ")) {
    ckind = CompositeKind::kUnion;
    text = trim(text.substr(6));
  } else if (text.starts_with("enum ")) {
    is_enum = true;
    text = trim(text.substr(5));
  }

  TypeId id = kInvalidTypeId;
  if (ckind) {
    id = _graph.find_composite(*ckind, text);
  } else if (is_enum) {
    id = _graph.find_enum(text);
  } else {
    id = _graph.find_named(text);
  }

  if (id == kInvalidTypeId) {
    auto native = std::find_if(std::begin(kNativeDefaults), std::end(kNativeDefaults), [text](NativeInfo const& n) {
      return n._name == text;
    });
    std::optional<NativeInfo> pseudo = pseudo_type(text);
    if (!ckind && !is_enum && native != std::end(kNativeDefaults)) {
      id = _graph.primitive(native->_name, native->_size, native->_signed, native->_floating);
    } else if (!ckind && !is_enum && pseudo) {
      id = _graph.primitive(pseudo->_name, pseudo->_size, pseudo->_signed, pseudo->_floating);
    } else {
      if (_unknown_names.insert(std::string(text)).second) {
        _load_diags.warn(DiagKind::kUnknownType, std::string(text), "not in the type table");
      }
      if (ckind) {
        // Known to be a composite, an incomplete one is as good as it gets
        id = _graph.declare_composite(*ckind, text);
      } else if (is_enum) {
        id = _graph.declare_enum(text, 4);
      } else {
        id = _graph.opaque(text, 0);
      }
    }
  }

  for (size_t i = 0; i < depth; i++) {
    id = _graph.pointer_to(id);
  }
  return id;
}

TypeId JsonProgramSource::resolve_ref(json const& ref) {
  if (ref.is_string()) {
    return resolve_named(ref.get<std::string>());
  } else if (ref.is_object()) {
    if (ref.contains("pointer")) {
      return _graph.pointer_to(resolve_ref(ref.at("pointer")));
    } else if (ref.contains("array")) {
      return _graph.array_of(resolve_ref(ref.at("array")), ref.value("length", uint64_t(0)));
    } else if (ref.contains("function")) {
      json const& fn = ref.at("function");
      std::vector<TypeId> params;
      for (json const& param : fn.value("params", json::array())) {
        params.push_back(resolve_ref(param));
      }
      TypeId ret = resolve_ref(fn.value("return", json("void")));
      return _graph.function(ret, params, fn.value("varargs", false));
    }
  }
  _load_diags.warn(DiagKind::kUnknownType, ref.dump(), "unrecognized type reference");
  return kInvalidTypeId;
}

DecompRecord JsonProgramSource::load_record(FunctionInfo const& info, json const& out) {
  DecompRecord record{
    ._address = info._address,
    ._name = info._name,
    ._signature = info._signature,
    ._proto = info._proto,
    ._body = out.value("body", std::string()),
  };

  for (json const& ref : out.value("types", json::array())) {
    record._type_refs.push_back(resolve_ref(ref));
  }

  for (json const& global : out.value("globals", json::array())) {
    GlobalRef ref{
      ._name = global.at("name").get<std::string>(),
      ._type = global.contains("type") ? resolve_ref(global.at("type")) : kInvalidTypeId,
      ._quals = parse_qualifiers(global.value("qualifiers", json())),
      ._storage = global.value("storage", std::string("data")) == "function" ? GlobalStorage::kFunction
                                                                              : GlobalStorage::kData,
    };
    if (global.contains("address")) {
      ref._address = json_address(global.at("address"));
    }
    record._globals.push_back(std::move(ref));
  }

  for (json const& call : out.value("calls", json::array())) {
    CallRef ref;
    if (call.is_object()) {
      if (call.contains("address")) {
        ref._callee = json_address(call.at("address"));
      }
      ref._name = call.value("name", std::string());
      ref._signature = call.value("signature", std::string());
    } else {
      ref._callee = json_address(call);
    }
    if (!ref._callee && ref._name.empty()) {
      _load_diags.warn(DiagKind::kUnknownCallee, info._name, fmt::format("unreadable call entry {}", call.dump()));
      continue;
    }
    record._calls.push_back(std::move(ref));
  }

  for (json const& equate : out.value("equates", json::array())) {
    record._equates.push_back(EquateRef{equate.at("name").get<std::string>(), json_text(equate.at("value"))});
  }
  return record;
}

std::optional<std::string> JsonProgramSource::load_function(json const& entry) {
  std::optional<uint64_t> address = json_address(entry.at("address"));
  if (!address) {
    return fmt::format("Bad function address {}", entry.at("address").dump());
  }
  if (_records.contains(*address)) {
    return fmt::format("Function address {} listed twice", format_address(*address));
  }

  FunctionInfo info{
    ._address = *address,
    ._name = entry.value("name", fmt::format("FUN_{:08x}", *address)),
    ._tags = entry.value("tags", std::vector<std::string>()),
    ._signature = entry.value("signature", std::string()),
    ._external = entry.value("external", false),
  };
  if (entry.contains("prototype")) {
    json const& proto = entry.at("prototype");
    std::vector<TypeId> params;
    for (json const& param : proto.value("params", json::array())) {
      params.push_back(resolve_ref(param));
    }
    TypeId ret = resolve_ref(proto.value("return", json("void")));
    info._proto = _graph.function(ret, params, proto.value("varargs", false));
  }
  if (entry.contains("thunk_of")) {
    info._thunk_of = json_address(entry.at("thunk_of"));
    if (!info._thunk_of) {
      return fmt::format("Bad thunk target {} for {}", entry.at("thunk_of").dump(), info._name);
    }
  }

  if (entry.contains("decompiled")) {
    _records.emplace(info._address, load_record(info, entry.at("decompiled")));
  } else if (entry.contains("error")) {
    _records.emplace(info._address, json_text(entry.at("error")));
  } else {
    _records.emplace(info._address, "no decompiler output");
  }
  _functions.push_back(std::move(info));
  return std::nullopt;
}

std::optional<std::string> JsonProgramSource::load_from(std::istream& source) {
  try {
    json db = json::parse(source);
    if (!db.is_object()) {
      return "Program database must be a JSON object";
    }
    _program = db.value("program", std::string());

    json const types = db.value("types", json::array());
    std::unordered_set<std::string> seen;
    for (json const& entry : types) {
      declare_type(entry, seen);
    }
    for (json const& entry : types) {
      define_type(entry);
    }

    for (json const& entry : db.value("functions", json::array())) {
      std::optional<std::string> err = load_function(entry);
      if (err) {
        return err;
      }
    }
  } catch (json::exception const& e) {
    return fmt::format("Malformed program database: {}", e.what());
  }
  return std::nullopt;
}

ErrorOr<DecompRecord> JsonProgramSource::decompile(uint64_t address) const {
  auto it = _records.find(address);
  if (it == _records.end()) {
    return fmt::format("no function at {}", format_address(address));
  }
  return it->second;
}
}  // namespace tuslice
