#include "driver/ExportRun.hh"

#include <fmt/format.h>

#include "aggregate/Aggregator.hh"
#include "closure/SymbolClosure.hh"

namespace tuslice {
std::optional<std::string> validate_render_config(RenderConfig const& config) {
  if (config._mode == OutputMode::kDocument) {
    if (config._emit_header || config._emit_source) {
      return "JSON output cannot be combined with source or header artifacts";
    }
    return std::nullopt;
  }
  if (!config._emit_source && !config._emit_header) {
    return "No output files selected.";
  }
  if (config._emit_header && config._header_name.empty()) {
    return "Header artifact needs a file name";
  }
  return std::nullopt;
}

std::vector<FunctionInfo> exportable_functions(std::vector<FunctionInfo> const& functions) {
  std::vector<FunctionInfo> ret;
  for (FunctionInfo const& fn : functions) {
    if (!fn._external) {
      ret.push_back(fn);
    }
  }
  return ret;
}

ErrorOr<RunResult> run(DecompSource const& source,
  SelectionConfig const& selection,
  RenderConfig const& render,
  RunOptions const& opts) {
  if (std::optional<std::string> err = validate_render_config(render)) {
    return *err;
  }

  Diagnostics diags;
  std::vector<FunctionInfo> universe = source.list_functions();
  ErrorOr<SelectedFunctionSet> selected = select_functions(exportable_functions(universe), selection, diags);
  if (selected.is_error()) {
    return selected.err();
  }

  std::vector<DecompOutcome> outcomes;
  outcomes.reserve(selected.val().size());
  size_t decompiled = 0;
  for (SelectedFunction const& fn : selected.val()) {
    outcomes.push_back(source.decompile(fn._address));
    if (!outcomes.back().is_error()) {
      decompiled++;
    }
  }
  if (!selected.val().empty() && decompiled == 0) {
    return fmt::format("None of the {} selected functions could be decompiled", selected.val().size());
  }

  FunctionIndex index(std::move(universe));
  AggregateOptions agg_opts{._strict_conflicts = opts._strict_conflicts, ._jobs = opts._jobs};
  ErrorOr<AggregatedModel> model = aggregate(source.types(), index, selected.val(), outcomes, agg_opts, diags);
  if (model.is_error()) {
    return model.err();
  }

  RenderedOutput output = render_sections(source.types(), model.val(), render, diags);
  return RunResult{
    ._primary = std::move(output._primary),
    ._header = std::move(output._header),
    ._document = std::move(output._document),
    ._warnings = diags.list(),
    ._selected_count = selected.val().size(),
    ._decompiled_count = decompiled,
  };
}
}  // namespace tuslice
