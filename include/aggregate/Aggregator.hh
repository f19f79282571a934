#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "closure/SymbolClosure.hh"
#include "model/DeclarationSet.hh"
#include "model/DecompRecord.hh"
#include "model/Diagnostics.hh"
#include "model/TypeGraph.hh"
#include "select/SelectionFilter.hh"
#include "utl/ErrorOr.hh"

namespace tuslice {
struct FunctionBody {
  uint64_t _address;
  std::string _name;
  std::string _signature;
  TypeId _proto;
  std::string _body;
};

struct FailedFunction {
  uint64_t _address;
  std::string _name;
  std::string _reason;
};

struct AggregatedModel {
  DeclarationSet _decls;
  // Selection order
  std::vector<FunctionBody> _bodies;
  std::vector<FailedFunction> _failures;
};

struct AggregateOptions {
  // Conflicting globals, signatures or equates abort aggregation
  bool _strict_conflicts = false;
  // Worker threads for the per-function closure stage
  unsigned _jobs = 1;
};

// Outcome of decompiling one selected function, parallel to the selected set
using DecompOutcome = ErrorOr<DecompRecord>;

ErrorOr<AggregatedModel> aggregate(TypeGraph const& graph,
  FunctionIndex const& index,
  SelectedFunctionSet const& selected,
  std::vector<DecompOutcome> const& outcomes,
  AggregateOptions const& opts,
  Diagnostics& diags);
}  // namespace tuslice
