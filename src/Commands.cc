#include "Commands.hh"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <thread>

#include "aggregate/Aggregator.hh"
#include "driver/ExportRun.hh"
#include "producers/JsonProgramSource.hh"
#include "render/TypeWriter.hh"
#include "utl/LaunchCommand.hh"
#include "utl/StringUtil.hh"

namespace tuslice {
namespace {
ErrorOr<std::unique_ptr<JsonProgramSource>> load_database(std::string const& path) {
  std::ifstream file_in(path);
  if (!file_in.is_open()) {
    return fmt::format("Failed to open path {}", path);
  }

  auto source = std::make_unique<JsonProgramSource>();
  if (auto fail_reason = source->load_from(file_in)) {
    return fmt::format("Failed to load {}, reason: {}", path, *fail_reason);
  }
  return source;
}

void print_warnings(std::vector<Diagnostic> const& warnings) {
  for (Diagnostic const& diag : warnings) {
    std::cerr << fmt::format("Warning: {}\n", format_diagnostic(diag));
  }
}

bool write_artifact(std::filesystem::path const& path, std::string const& contents, bool verbose) {
  std::ofstream file_out(path, std::ios::binary);
  if (!file_out.is_open()) {
    std::cerr << fmt::format("Error: failed to open {} for writing\n", path.string());
    return false;
  }
  file_out << contents;
  if (!file_out) {
    std::cerr << fmt::format("Error: failed to write {}\n", path.string());
    return false;
  }
  if (verbose) {
    std::cerr << fmt::format("Wrote {} ({} bytes)\n", path.string(), contents.size());
  }
  return true;
}

SelectionConfig selection_from(CommandParamList const& cpl) {
  SelectionConfig ret{
    ._names = split_list(cpl.option_v<std::string>("functions")),
    ._tags = split_list(cpl.option_v<std::string>("tags")),
    ._tag_mode = cpl.option_v<bool>("tag-include") ? TagMode::kInclude : TagMode::kExclude,
    ._tolerate_bad_ranges = cpl.option_v<bool>("tolerate-ranges"),
  };
  if (cpl.has_option("addrs")) {
    ret._address_ranges = cpl.option_v<std::string>("addrs");
  }
  return ret;
}
}  // namespace

int export_program(CommandParamList const& cpl) {
  bool verbose = cpl.option_v<bool>('v');
  std::string const& db_path = cpl.param_v<std::string>(0);

  auto loaded = load_database(db_path);
  if (loaded.is_error()) {
    std::cerr << fmt::format("Error: {}\n", loaded.err());
    return 1;
  }
  std::unique_ptr<JsonProgramSource> source = loaded.take();
  print_warnings(source->load_diagnostics().list());

  std::string base = cpl.option_v<std::string>("base");
  if (base.empty()) {
    base = source->program_name().empty() ? std::filesystem::path(db_path).stem().string()
                                          : std::string(source->program_name());
  }
  bool json_mode = cpl.option_v<bool>("json");

  RenderConfig render{
    ._mode = json_mode ? OutputMode::kDocument : OutputMode::kText,
    ._emit_source = !json_mode && !cpl.option_v<bool>("no-source"),
    ._emit_header = cpl.option_v<bool>("header"),
    ._header_name = fmt::format("{}.h", base),
    ._comments = cpl.option_v<bool>("c-comments") ? CommentStyle::kC : CommentStyle::kCpp,
    ._emit_types = !cpl.option_v<bool>("no-types"),
    ._emit_equates = !cpl.option_v<bool>("no-equates"),
    ._emit_declarations = !cpl.option_v<bool>("no-decls"),
    ._emit_globals = !cpl.option_v<bool>("no-globals"),
    ._declare_selected = !cpl.option_v<bool>("no-declare-selected"),
    ._define_globals = cpl.option_v<bool>("define-globals"),
    ._emit_prelude = !cpl.option_v<bool>("no-prelude"),
    ._emit_failure_stubs = !cpl.option_v<bool>("no-stubs"),
  };

  unsigned jobs = cpl.option_v<uint32_t>("jobs");
  if (jobs == 0) {
    jobs = std::max(1u, std::thread::hardware_concurrency());
  }
  RunOptions opts{._strict_conflicts = cpl.option_v<bool>("strict"), ._jobs = jobs};

  ErrorOr<RunResult> result = run(*source, selection_from(cpl), render, opts);
  if (result.is_error()) {
    std::cerr << fmt::format("Error: {}\n", result.err());
    return 1;
  }
  RunResult const& res = result.val();
  print_warnings(res._warnings);

  std::filesystem::path out_dir = cpl.option_v<std::string>("out");
  std::error_code ec;
  std::filesystem::create_directories(out_dir, ec);
  if (ec) {
    std::cerr << fmt::format("Error: failed to create {}: {}\n", out_dir.string(), ec.message());
    return 1;
  }

  bool ok = true;
  if (res._primary) {
    ok &= write_artifact(out_dir / fmt::format("{}.c", base), *res._primary, verbose);
  }
  if (res._header) {
    ok &= write_artifact(out_dir / render._header_name, *res._header, verbose);
  }
  if (res._document) {
    ok &= write_artifact(out_dir / fmt::format("{}.json", base), *res._document, verbose);
  }
  if (verbose) {
    std::cerr << fmt::format("Exported {} of {} selected functions, {} warnings\n",
      res._decompiled_count,
      res._selected_count,
      res._warnings.size());
  }
  return ok ? 0 : 1;
}

int list_functions(CommandParamList const& cpl) {
  auto loaded = load_database(cpl.param_v<std::string>(0));
  if (loaded.is_error()) {
    std::cerr << fmt::format("Error: {}\n", loaded.err());
    return 1;
  }
  std::unique_ptr<JsonProgramSource> source = loaded.take();

  for (FunctionInfo const& fn : source->list_functions()) {
    std::string status;
    if (fn._external) {
      status = "external";
    } else if (fn._thunk_of) {
      status = fmt::format("thunk -> {}", format_address(*fn._thunk_of));
    } else {
      ErrorOr<DecompRecord> record = source->decompile(fn._address);
      status = record.is_error() ? fmt::format("failed: {}", record.err()) : std::string("ok");
    }
    std::cout << fmt::format("{:>12}  {:<32} {:<24} [{}]\n",
      format_address(fn._address),
      fn._name,
      status,
      fmt::join(fn._tags, ", "));
  }
  return 0;
}

int show_closure(CommandParamList const& cpl) {
  auto loaded = load_database(cpl.param_v<std::string>(0));
  if (loaded.is_error()) {
    std::cerr << fmt::format("Error: {}\n", loaded.err());
    return 1;
  }
  std::unique_ptr<JsonProgramSource> source = loaded.take();
  std::string const& name = cpl.param_v<std::string>(1);

  Diagnostics diags;
  SelectionConfig selection{._names = {name}};
  ErrorOr<SelectedFunctionSet> selected =
    select_functions(exportable_functions(source->list_functions()), selection, diags);
  if (selected.is_error()) {
    std::cerr << fmt::format("Error: {}\n", selected.err());
    return 1;
  }
  if (selected.val().empty()) {
    std::cerr << fmt::format("Error: no function named '{}'\n", name);
    return 1;
  }

  std::vector<DecompOutcome> outcomes;
  for (SelectedFunction const& fn : selected.val()) {
    outcomes.push_back(source->decompile(fn._address));
  }
  FunctionIndex index(source->list_functions());
  ErrorOr<AggregatedModel> model = aggregate(source->types(), index, selected.val(), outcomes, {}, diags);
  if (model.is_error()) {
    std::cerr << fmt::format("Error: {}\n", model.err());
    return 1;
  }

  TypeGraph const& graph = source->types();
  TypeWriter writer(graph);
  DeclarationSet const& decls = model.val()._decls;
  std::cout << fmt::format("Closure of '{}'\n", name);
  std::cout << fmt::format("Types ({}):\n", decls._types.size());
  for (auto const& [id, state] : decls._types) {
    std::cout << fmt::format("    {:<10} {}\n", type_kind_str(graph.kind(id)), writer.type_name(id));
  }
  std::cout << fmt::format("Globals ({}):\n", decls._globals.size());
  for (auto const& [gname, global] : decls._globals) {
    std::cout << fmt::format("    {}\n", writer.declare(global._type, gname));
  }
  std::cout << fmt::format("Called functions ({}):\n", decls._functions.size());
  for (auto const& [fname, fn] : decls._functions) {
    std::cout << fmt::format("    {}\n", fn._signature.empty() ? missing_signature_comment(fname) : fn._signature);
  }
  std::cout << fmt::format("Equates ({}):\n", decls._equates.size());
  for (auto const& [ename, equate] : decls._equates) {
    std::cout << fmt::format("    {} = {}\n", ename, equate._value);
  }
  print_warnings(diags.list());
  return model.val()._bodies.empty() ? 1 : 0;
}
}  // namespace tuslice
