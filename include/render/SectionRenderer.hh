#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "aggregate/Aggregator.hh"
#include "model/Diagnostics.hh"
#include "model/TypeGraph.hh"
#include "utl/FlagsEnum.hh"

namespace tuslice {
enum class SectionMask : uint8_t {
  kNone = 0,
  kAll = 0b11111,
  kDeclarationsOnly = 0b01111,

  kTypes = 1u << 0,
  kEquates = 1u << 1,
  kDeclarations = 1u << 2,
  kGlobals = 1u << 3,
  kImplementations = 1u << 4,
};
GEN_FLAG_OPERATORS(SectionMask)

enum class CommentStyle {
  // `// ...`
  kCpp,
  // `/* ... */`
  kC,
};

enum class OutputMode {
  // Source and/or header text
  kText,
  // One JSON document keyed by function address
  kDocument,
};

struct RenderConfig {
  OutputMode _mode = OutputMode::kText;
  bool _emit_source = true;
  bool _emit_header = false;
  // Name the source artifact uses to include the header
  std::string _header_name;
  CommentStyle _comments = CommentStyle::kCpp;

  bool _emit_types = true;
  bool _emit_equates = true;
  bool _emit_declarations = true;
  bool _emit_globals = true;

  // Prototypes of the emitted functions themselves, ahead of their callees
  bool _declare_selected = true;
  // Plain definitions instead of extern declarations
  bool _define_globals = false;
  bool _emit_prelude = true;
  bool _emit_failure_stubs = true;
};

struct RenderedOutput {
  std::optional<std::string> _primary;
  std::optional<std::string> _header;
  std::optional<std::string> _document;
};

std::string section_banner(std::string_view title, std::string_view desc, CommentStyle style);

// Sections in `mask` (further narrowed by the config's section switches), in their fixed order.
// Empty sections produce no banner.
std::string render_section_text(TypeGraph const& graph,
  AggregatedModel const& model,
  RenderConfig const& config,
  SectionMask mask,
  Diagnostics& diags);

// Routes the sections to the artifacts the config asks for
RenderedOutput render_sections(TypeGraph const& graph,
  AggregatedModel const& model,
  RenderConfig const& config,
  Diagnostics& diags);
}  // namespace tuslice
