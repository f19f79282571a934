#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "model/Diagnostics.hh"
#include "producers/DecompSource.hh"
#include "render/SectionRenderer.hh"
#include "select/SelectionFilter.hh"
#include "utl/ErrorOr.hh"

namespace tuslice {
struct RunOptions {
  bool _strict_conflicts = false;
  unsigned _jobs = 1;
};

struct RunResult {
  std::optional<std::string> _primary;
  std::optional<std::string> _header;
  std::optional<std::string> _document;
  std::vector<Diagnostic> _warnings;
  size_t _selected_count = 0;
  size_t _decompiled_count = 0;
};

// Checks that the render config asks for exactly one coherent set of artifacts
std::optional<std::string> validate_render_config(RenderConfig const& config);

// Functions that may be selected for a body. Imported functions are only ever declared.
std::vector<FunctionInfo> exportable_functions(std::vector<FunctionInfo> const& functions);

// Select, decompile, aggregate, render. Nothing is decompiled when the configuration is invalid.
ErrorOr<RunResult> run(DecompSource const& source,
  SelectionConfig const& selection,
  RenderConfig const& render,
  RunOptions const& opts);
}  // namespace tuslice
