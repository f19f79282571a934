#include "render/SectionRenderer.hh"

#include <fmt/format.h>

#include <nlohmann/json.hpp>
#include <sstream>
#include <unordered_map>
#include <vector>

#include "closure/SymbolClosure.hh"
#include "render/FormatPrinter.hh"
#include "render/TypeWriter.hh"
#include "utl/StringUtil.hh"

namespace tuslice {
namespace {
constexpr std::string_view kBannerRule = "==============================================================================";

struct SectionInfo {
  SectionMask _section;
  std::string_view _title;
  std::string_view _desc;
};

constexpr SectionInfo kSections[] = {
  {SectionMask::kTypes, "DATA TYPES", "These types were decompiled from the binary and may not match original source"},
  {SectionMask::kEquates, "EQUATES / DEFINES", "Constants and named values extracted from the binary"},
  {SectionMask::kDeclarations,
    "FUNCTION DECLARATIONS",
    "These function prototypes were extracted from binary analysis"},
  {SectionMask::kGlobals, "GLOBAL VARIABLES", "These global variables were referenced in the decompiled functions"},
  {SectionMask::kImplementations, "FUNCTION IMPLEMENTATIONS", "Decompiled code from the binary"},
};

// Orders composite bodies and typedefs so that everything one of them needs complete comes first
class DefinitionOrder {
  enum class Mark { kVisiting, kDone };

  TypeGraph const& _graph;
  TypeWriter const& _writer;
  OrderedTable<TypeId, EntryState> const& _closure;
  FormatPrinter& _printer;
  Diagnostics& _diags;
  std::unordered_map<TypeId, Mark> _marks;

  // Named types that must be declared (typedefs) or complete (by-value composites) before `id` can
  // be spelled in a declaration
  void collect(TypeId id, bool by_value, std::vector<TypeId>& deps, size_t budget) const {
    if (!_graph.valid(id) || budget == 0) {
      return;
    }
    switch (_graph.kind(id)) {
      case TypeKind::kTypedef:
        deps.push_back(id);
        if (by_value) {
          collect(_graph.as<TypedefType>(id)._alias, true, deps, budget - 1);
        }
        break;
      case TypeKind::kComposite:
        if (by_value) {
          deps.push_back(id);
        }
        break;
      case TypeKind::kPointer:
        collect(_graph.as<PointerType>(id)._to, false, deps, budget - 1);
        break;
      case TypeKind::kArray:
        collect(_graph.as<ArrayType>(id)._of, true, deps, budget - 1);
        break;
      case TypeKind::kFunction: {
        FunctionType const& ft = _graph.as<FunctionType>(id);
        collect(ft._ret, false, deps, budget - 1);
        for (TypeId param : ft._params) {
          collect(param, false, deps, budget - 1);
        }
        break;
      }
      default:
        break;
    }
  }

  std::vector<TypeId> dependencies(TypeId id) const {
    std::vector<TypeId> deps;
    size_t budget = _graph.size() + 1;
    if (_graph.kind(id) == TypeKind::kTypedef) {
      collect(_graph.as<TypedefType>(id)._alias, false, deps, budget);
    } else {
      for (CompositeField const& field : _graph.as<CompositeType>(id)._fields) {
        collect(field._type, true, deps, budget);
      }
    }
    return deps;
  }

  void write(TypeId id) {
    if (_graph.kind(id) == TypeKind::kTypedef) {
      _writer.write_typedef(id, _printer);
    } else {
      _writer.write_composite(id, _printer);
    }
  }

public:
  DefinitionOrder(TypeGraph const& graph,
    TypeWriter const& writer,
    OrderedTable<TypeId, EntryState> const& closure,
    FormatPrinter& printer,
    Diagnostics& diags)
      : _graph(graph), _writer(writer), _closure(closure), _printer(printer), _diags(diags) {}

  void emit(TypeId id) {
    auto it = _marks.find(id);
    if (it != _marks.end()) {
      if (it->second == Mark::kVisiting) {
        _diags.warn(DiagKind::kTypeCycle,
          std::string(_graph.name(id)),
          "needs itself complete through by-value members, emitted in discovery order");
      }
      return;
    }

    _marks.emplace(id, Mark::kVisiting);
    for (TypeId dep : dependencies(id)) {
      if (dep != id && _closure.contains(dep)) {
        emit(dep);
      }
    }
    write(id);
    _marks[id] = Mark::kDone;
  }
};

void write_types(TypeGraph const& graph,
  AggregatedModel const& model,
  RenderConfig const& config,
  FormatPrinter& printer,
  Diagnostics& diags) {
  TypeWriter writer(graph);
  OrderedTable<TypeId, EntryState> const& types = model._decls._types;

  if (config._emit_prelude) {
    write_prelude(printer);
  }

  auto each_of_kind = [&](TypeKind kind, auto&& fn) {
    for (auto const& [id, state] : types) {
      if (graph.kind(id) == kind) {
        fn(id);
      }
    }
  };

  auto in_prelude = [&](TypeId id) { return config._emit_prelude && is_prelude_type(graph.name(id)); };
  each_of_kind(TypeKind::kPrimitive, [&](TypeId id) {
    if (!in_prelude(id)) {
      writer.write_primitive(id, printer);
    }
  });
  each_of_kind(TypeKind::kOpaque, [&](TypeId id) {
    if (!in_prelude(id)) {
      writer.write_opaque(id, printer);
    }
  });
  each_of_kind(TypeKind::kComposite, [&](TypeId id) { writer.write_forward(id, printer); });
  each_of_kind(TypeKind::kEnum, [&](TypeId id) { writer.write_enum(id, printer); });

  DefinitionOrder order(graph, writer, types, printer, diags);
  for (auto const& [id, state] : types) {
    TypeKind kind = graph.kind(id);
    if (kind == TypeKind::kTypedef || kind == TypeKind::kComposite) {
      order.emit(id);
    }
  }
}

void write_equates(AggregatedModel const& model, FormatPrinter& printer) {
  for (auto const& [name, equate] : model._decls._equates) {
    printer.line(fmt::format("#define {} {}", equate._name, equate._value));
  }
}

void write_declarations(AggregatedModel const& model, RenderConfig const& config, FormatPrinter& printer) {
  if (config._declare_selected) {
    for (FunctionBody const& body : model._bodies) {
      if (!body._signature.empty()) {
        printer.line(body._signature);
      }
    }
  }
  for (auto const& [name, fn] : model._decls._functions) {
    printer.line(fn._signature.empty() ? missing_signature_comment(fn._name) : fn._signature);
  }
}

void write_globals(TypeGraph const& graph,
  AggregatedModel const& model,
  RenderConfig const& config,
  FormatPrinter& printer) {
  TypeWriter writer(graph);
  for (auto const& [name, global] : model._decls._globals) {
    std::string quals;
    if (check_flags(global._quals, Qualifiers::kConst)) {
      quals += "const ";
    }
    if (check_flags(global._quals, Qualifiers::kVolatile)) {
      quals += "volatile ";
    }
    std::string decl = graph.valid(global._type) ? writer.declare(global._type, global._name)
                                                 : fmt::format("unsigned char {}", global._name);
    printer.line(fmt::format("{}{}{};", config._define_globals ? "" : "extern ", quals, decl));
  }
}

std::string failure_stub(FailedFunction const& failure) {
  // The reason must not close the comment early
  std::string reason = failure._reason;
  for (size_t pos = reason.find("*/"); pos != std::string::npos; pos = reason.find("*/", pos)) {
    reason.replace(pos, 2, "* /");
  }
  return fmt::format("/*\nUnable to decompile '{}'\nCause: {}\n*/\n", failure._name, reason);
}

void write_implementations(AggregatedModel const& model, RenderConfig const& config, FormatPrinter& printer) {
  for (FunctionBody const& body : model._bodies) {
    printer.write_block(body._body);
    printer.linebreak();
  }
  if (config._emit_failure_stubs) {
    for (FailedFunction const& failure : model._failures) {
      printer.write_block(failure_stub(failure));
      printer.linebreak();
    }
  }
}

SectionMask enabled_sections(RenderConfig const& config) {
  SectionMask mask = SectionMask::kImplementations;
  if (config._emit_types) {
    mask = mask | SectionMask::kTypes;
  }
  if (config._emit_equates) {
    mask = mask | SectionMask::kEquates;
  }
  if (config._emit_declarations) {
    mask = mask | SectionMask::kDeclarations;
  }
  if (config._emit_globals) {
    mask = mask | SectionMask::kGlobals;
  }
  return mask;
}
}  // namespace

std::string section_banner(std::string_view title, std::string_view desc, CommentStyle style) {
  std::string_view open = style == CommentStyle::kCpp ? "//" : "/*";
  std::string_view close = style == CommentStyle::kCpp ? "" : " */";
  return fmt::format(
    "\n{0}{1}{2}\n{0} {3:<74}{2}\n{0} {4:<74}{2}\n{0}{1}{2}\n", open, kBannerRule, close, title, desc);
}

std::string render_section_text(TypeGraph const& graph,
  AggregatedModel const& model,
  RenderConfig const& config,
  SectionMask mask,
  Diagnostics& diags) {
  mask = mask & enabled_sections(config);

  std::ostringstream out;
  for (SectionInfo const& info : kSections) {
    if (!check_flags(mask, info._section)) {
      continue;
    }

    std::ostringstream content;
    FormatPrinter printer(content, 2);
    switch (info._section) {
      case SectionMask::kTypes:
        write_types(graph, model, config, printer, diags);
        break;
      case SectionMask::kEquates:
        write_equates(model, printer);
        break;
      case SectionMask::kDeclarations:
        write_declarations(model, config, printer);
        break;
      case SectionMask::kGlobals:
        write_globals(graph, model, config, printer);
        break;
      case SectionMask::kImplementations:
        write_implementations(model, config, printer);
        break;
      default:
        break;
    }

    std::string text = content.str();
    if (text.empty()) {
      continue;
    }
    out << section_banner(info._title, info._desc, config._comments) << "\n" << text << "\n";
  }
  return out.str();
}

RenderedOutput render_sections(TypeGraph const& graph,
  AggregatedModel const& model,
  RenderConfig const& config,
  Diagnostics& diags) {
  RenderedOutput ret;

  if (config._mode == OutputMode::kDocument) {
    nlohmann::ordered_json doc;
    doc["header"] = render_section_text(graph, model, config, SectionMask::kDeclarationsOnly, diags);
    nlohmann::ordered_json functions = nlohmann::ordered_json::object();
    for (FunctionBody const& body : model._bodies) {
      functions[format_address(body._address)] = {
        {"name", body._name},
        {"signature", body._signature},
        {"body", body._body},
      };
    }
    doc["functions"] = std::move(functions);
    ret._document = doc.dump(2) + "\n";
    return ret;
  }

  if (config._emit_header) {
    ret._header = render_section_text(graph, model, config, SectionMask::kDeclarationsOnly, diags);
    if (config._emit_source) {
      std::string include = fmt::format("#include \"{}\"\n", config._header_name);
      ret._primary = include + render_section_text(graph, model, config, SectionMask::kImplementations, diags);
    }
  } else if (config._emit_source) {
    ret._primary = render_section_text(graph, model, config, SectionMask::kAll, diags);
  }
  return ret;
}
}  // namespace tuslice
