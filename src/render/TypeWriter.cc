#include "render/TypeWriter.hh"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <array>
#include <vector>

namespace tuslice {
namespace {
constexpr std::array<std::string_view, 20> kNativeTypes = {
  "void",
  "char",
  "signed char",
  "unsigned char",
  "short",
  "unsigned short",
  "int",
  "signed",
  "unsigned",
  "unsigned int",
  "long",
  "unsigned long",
  "long long",
  "unsigned long long",
  "float",
  "double",
  "long double",
  "_Bool",
  "short int",
  "long int",
};

// Smallest C integer type that holds `size` bytes, long long past that
std::string integer_ctype(uint32_t size, bool is_signed) {
  std::string_view base;
  if (size <= 1) {
    return is_signed ? "signed char" : "unsigned char";
  } else if (size <= 2) {
    base = "short";
  } else if (size <= 4) {
    base = "int";
  } else {
    base = "long long";
  }
  return is_signed ? std::string(base) : fmt::format("unsigned {}", base);
}

std::string_view float_ctype(uint32_t size) {
  if (size <= 4) {
    return "float";
  } else if (size <= 8) {
    return "double";
  }
  return "long double";
}

std::string join_declarator(std::string_view base, std::string_view inner) {
  if (inner.empty()) {
    return std::string(base);
  }
  return fmt::format("{} {}", base, inner);
}

void write_bool_guard(FormatPrinter& printer) {
  printer.line("#if !defined(__cplusplus) && !defined(NO_BOOL)");
  printer.line("typedef unsigned char bool;");
  printer.line("#endif");
}
}  // namespace

bool is_native_c_type(std::string_view name) {
  return std::find(kNativeTypes.begin(), kNativeTypes.end(), name) != kNativeTypes.end();
}

bool is_prelude_type(std::string_view name) {
  if (name == "BADSPACEBASE" || name == "code" || name == "bool") {
    return true;
  }
  for (std::string_view prefix : {"unkbyte", "unkuint", "unkint"}) {
    if (name.starts_with(prefix)) {
      std::string_view num = name.substr(prefix.size());
      return num == "9" || (num.size() == 2 && num[0] == '1' && num[1] >= '0' && num[1] <= '6');
    }
  }
  if (name.starts_with("unkfloat")) {
    std::string_view num = name.substr(8);
    return num == "1" || num == "2" || num == "3" || num == "5" || num == "6" || num == "7" || num == "9" ||
           (num.size() == 2 && num[0] == '1' && num[1] >= '1' && num[1] <= '6');
  }
  return false;
}

void write_prelude(FormatPrinter& printer) {
  for (std::string_view prefix : {"unkbyte", "unkuint", "unkint"}) {
    bool is_signed = prefix == "unkint";
    for (uint32_t n = 9; n <= 16; n++) {
      printer.line(fmt::format("typedef {} {}{};", integer_ctype(n, is_signed), prefix, n));
    }
    printer.linebreak();
  }

  for (uint32_t n : {1, 2, 3}) {
    printer.line(fmt::format("typedef float unkfloat{};", n));
  }
  for (uint32_t n : {5, 6, 7}) {
    printer.line(fmt::format("typedef double unkfloat{};", n));
  }
  printer.line("typedef long double unkfloat9;");
  for (uint32_t n = 11; n <= 16; n++) {
    printer.line(fmt::format("typedef long double unkfloat{};", n));
  }
  printer.linebreak();

  printer.line("typedef void BADSPACEBASE;");
  printer.line("typedef void code;");
  printer.linebreak();

  write_bool_guard(printer);
  printer.linebreak();
}

std::string TypeWriter::declare(TypeId id, std::string_view inner) const {
  if (!_graph.valid(id)) {
    return join_declarator("void", inner);
  }

  switch (_graph.kind(id)) {
    case TypeKind::kPointer: {
      TypeId to = _graph.as<PointerType>(id)._to;
      std::string decl = fmt::format("*{}", inner);
      if (_graph.valid(to) && (_graph.kind(to) == TypeKind::kArray || _graph.kind(to) == TypeKind::kFunction)) {
        decl = fmt::format("({})", decl);
      }
      return declare(to, decl);
    }
    case TypeKind::kArray: {
      ArrayType const& at = _graph.as<ArrayType>(id);
      if (at._length == 0) {
        return declare(at._of, fmt::format("{}[]", inner));
      }
      return declare(at._of, fmt::format("{}[{}]", inner, at._length));
    }
    case TypeKind::kFunction: {
      FunctionType const& ft = _graph.as<FunctionType>(id);
      std::vector<std::string> params;
      for (TypeId param : ft._params) {
        params.push_back(declare(param, ""));
      }
      if (ft._varargs) {
        params.push_back("...");
      }
      std::string plist = params.empty() ? std::string("void") : fmt::format("{}", fmt::join(params, ", "));
      return declare(ft._ret, fmt::format("{}({})", inner, plist));
    }
    default:
      return join_declarator(_graph.name(id), inner);
  }
}

void TypeWriter::write_primitive(TypeId id, FormatPrinter& printer) const {
  PrimitiveType const& pt = _graph.as<PrimitiveType>(id);
  if (is_native_c_type(pt._name)) {
    return;
  }
  if (pt._name == "bool") {
    write_bool_guard(printer);
  } else if (pt._size == 0) {
    printer.line(fmt::format("typedef void {};", pt._name));
  } else if (pt._floating) {
    printer.line(fmt::format("typedef {} {};", float_ctype(pt._size), pt._name));
  } else {
    printer.line(fmt::format("typedef {} {};", integer_ctype(pt._size, pt._signed), pt._name));
  }
}

void TypeWriter::write_opaque(TypeId id, FormatPrinter& printer) const {
  OpaqueType const& ot = _graph.as<OpaqueType>(id);
  if (ot._size == 0) {
    // Size unknown, one byte keeps it usable by value
    printer.line(fmt::format("typedef unsigned char {};", ot._name));
  } else {
    // Wrapped so it can still be returned and assigned
    printer.line(fmt::format("typedef struct {{ unsigned char _data[{}]; }} {};", ot._size, ot._name));
  }
}

void TypeWriter::write_forward(TypeId id, FormatPrinter& printer) const {
  CompositeType const& ct = _graph.as<CompositeType>(id);
  std::string_view keyword = ct._ckind == CompositeKind::kStruct ? "struct" : "union";
  printer.line(fmt::format("typedef {} {} {};", keyword, ct._name, ct._name));
}

void TypeWriter::write_enum(TypeId id, FormatPrinter& printer) const {
  EnumType const& et = _graph.as<EnumType>(id);
  if (et._members.empty()) {
    printer.line(fmt::format("typedef {} {};", integer_ctype(et._size, false), et._name));
    return;
  }

  printer.write(fmt::format("typedef enum {} {{", et._name));
  printer.indent();
  for (size_t i = 0; i < et._members.size(); i++) {
    printer.linebreak();
    printer.write(fmt::format("{} = {}", et._members[i]._name, et._members[i]._value));
    if (i + 1 < et._members.size()) {
      printer.write(",");
    }
  }
  printer.unindent();
  printer.linebreak();
  printer.line(fmt::format("}} {};", et._name));
}

bool TypeWriter::is_redundant_typedef(TypeId id) const {
  TypedefType const& tt = _graph.as<TypedefType>(id);
  if (!_graph.valid(tt._alias)) {
    return false;
  }
  switch (_graph.kind(tt._alias)) {
    case TypeKind::kComposite:
    case TypeKind::kEnum:
    case TypeKind::kPrimitive:
    case TypeKind::kOpaque:
      return _graph.name(tt._alias) == tt._name;
    default:
      return false;
  }
}

void TypeWriter::write_typedef(TypeId id, FormatPrinter& printer) const {
  if (is_redundant_typedef(id)) {
    return;
  }
  TypedefType const& tt = _graph.as<TypedefType>(id);
  if (!_graph.valid(tt._alias)) {
    printer.line(fmt::format("typedef unsigned char {};", tt._name));
    return;
  }
  printer.line(fmt::format("typedef {};", declare(tt._alias, tt._name)));
}

void TypeWriter::write_composite(TypeId id, FormatPrinter& printer) const {
  CompositeType const& ct = _graph.as<CompositeType>(id);
  if (!ct._defined) {
    return;
  }

  std::string_view keyword = ct._ckind == CompositeKind::kStruct ? "struct" : "union";
  printer.write(fmt::format("{} {} {{", keyword, ct._name));
  printer.indent();
  printer.linebreak();
  if (ct._fields.empty()) {
    printer.write("unsigned char _placeholder;");
  }
  for (size_t i = 0; i < ct._fields.size(); i++) {
    CompositeField const& field = ct._fields[i];
    std::string fname = field._name.empty() ? fmt::format("field_{}", i) : field._name;
    if (!_graph.valid(field._type)) {
      printer.write(fmt::format("unsigned char {};", fname));
    } else {
      printer.write(fmt::format("{};", declare(field._type, fname)));
    }
    if (i + 1 < ct._fields.size()) {
      printer.linebreak();
    }
  }
  printer.unindent();
  printer.linebreak();
  printer.line("};");
}
}  // namespace tuslice
