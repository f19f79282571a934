#include "aggregate/Aggregator.hh"

#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <thread>
#include <unordered_set>

#include "closure/TypeClosure.hh"
#include "utl/StringUtil.hh"

namespace tuslice {
namespace {
// Closure of one decompiled function, built independently of every other function
struct LocalClosure {
  DeclarationSet _decls;
  Diagnostics _diags;
};

void close_function(TypeGraph const& graph, DecompRecord const& record, SymbolContext const& ctx, LocalClosure& out) {
  close_symbols(record, ctx, out._decls, out._diags);

  OrderedTable<TypeId, EntryState>& types = out._decls._types;
  for (TypeId ref : record._type_refs) {
    close_type(graph, ref, types, out._diags);
  }
  close_type(graph, record._proto, types, out._diags);
  for (auto const& [name, fn] : out._decls._functions) {
    close_type(graph, fn._proto, types, out._diags);
  }
  for (auto const& [name, global] : out._decls._globals) {
    close_type(graph, global._type, types, out._diags);
  }
}

void run_closures(TypeGraph const& graph,
  std::vector<DecompOutcome> const& outcomes,
  SymbolContext const& ctx,
  unsigned jobs,
  std::vector<LocalClosure>& slots) {
  std::atomic<size_t> next = 0;
  auto worker = [&]() {
    for (size_t i = next++; i < outcomes.size(); i = next++) {
      if (!outcomes[i].is_error()) {
        close_function(graph, outcomes[i].val(), ctx, slots[i]);
      }
    }
  };

  unsigned nthreads = std::min<size_t>(std::max(jobs, 1u), outcomes.size());
  if (nthreads <= 1) {
    worker();
    return;
  }
  std::vector<std::thread> threads;
  threads.reserve(nthreads);
  for (unsigned i = 0; i < nthreads; i++) {
    threads.emplace_back(worker);
  }
  for (std::thread& t : threads) {
    t.join();
  }
}

bool is_conflict(DiagKind kind) {
  return kind == DiagKind::kGlobalConflict || kind == DiagKind::kSignatureConflict || kind == DiagKind::kEquateConflict;
}
}  // namespace

ErrorOr<AggregatedModel> aggregate(TypeGraph const& graph,
  FunctionIndex const& index,
  SelectedFunctionSet const& selected,
  std::vector<DecompOutcome> const& outcomes,
  AggregateOptions const& opts,
  Diagnostics& diags) {
  if (outcomes.size() != selected.size()) {
    return fmt::format("Got {} decompiler results for {} selected functions", outcomes.size(), selected.size());
  }

  std::unordered_set<uint64_t> emitted;
  for (size_t i = 0; i < selected.size(); i++) {
    if (!outcomes[i].is_error()) {
      emitted.insert(selected[i]._address);
    }
  }
  SymbolContext ctx{index, emitted};

  std::vector<LocalClosure> slots(selected.size());
  run_closures(graph, outcomes, ctx, opts._jobs, slots);

  // Merge in selection order so first discovery never depends on which worker finished first
  AggregatedModel model;
  Diagnostics local;
  for (size_t i = 0; i < selected.size(); i++) {
    SelectedFunction const& sel = selected[i];
    if (outcomes[i].is_error()) {
      local.warn(DiagKind::kDecompileFailure,
        sel._name,
        fmt::format("{} at {}", outcomes[i].err(), format_address(sel._address)));
      model._failures.push_back(FailedFunction{sel._address, sel._name, outcomes[i].err()});
      continue;
    }

    DecompRecord const& record = outcomes[i].val();
    LocalClosure const& closure = slots[i];
    for (Diagnostic const& diag : closure._diags.list()) {
      // Reported once per name, by whichever function referenced it first
      if (diag._kind == DiagKind::kMissingSignature && model._decls._functions.contains(diag._subject)) {
        continue;
      }
      local.warn(diag._kind, diag._subject, diag._message);
    }
    merge_declarations(model._decls, closure._decls, local);
    model._bodies.push_back(FunctionBody{
      ._address = record._address,
      ._name = record._name.empty() ? sel._name : record._name,
      ._signature = normalize_signature(record._signature),
      ._proto = record._proto,
      ._body = record._body,
    });
  }

  if (opts._strict_conflicts) {
    auto conflict = std::find_if(
      local.list().begin(), local.list().end(), [](Diagnostic const& d) { return is_conflict(d._kind); });
    if (conflict != local.list().end()) {
      return fmt::format("Conflicting declarations in strict mode: {}", format_diagnostic(*conflict));
    }
  }

  diags.append(local);
  return model;
}
}  // namespace tuslice
