#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "model/DecompRecord.hh"
#include "model/TypeGraph.hh"
#include "utl/ErrorOr.hh"

namespace tuslice {
// Boundary to whatever decompiles the program. All TypeIds handed out refer to types().
class DecompSource {
public:
  virtual ~DecompSource() {}

  virtual TypeGraph const& types() const = 0;
  virtual std::vector<FunctionInfo> list_functions() const = 0;
  // Error is the decompiler's reason for giving up on the function
  virtual ErrorOr<DecompRecord> decompile(uint64_t address) const = 0;

  virtual std::string_view program_name() const { return {}; }
};
}  // namespace tuslice
