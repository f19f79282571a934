#pragma once

#include <cstdint>
#include <istream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "model/Diagnostics.hh"
#include "producers/DecompSource.hh"

namespace tuslice {
// Program database exported by a decompiler as JSON: type table, function listing and the
// per-function decompiler output, all loaded up front
class JsonProgramSource : public DecompSource {
private:
  std::string _program;
  TypeGraph _graph;
  std::vector<FunctionInfo> _functions;
  std::unordered_map<uint64_t, ErrorOr<DecompRecord>> _records;
  std::unordered_set<std::string> _unknown_names;
  Diagnostics _load_diags;

private:
  void declare_type(nlohmann::json const& entry, std::unordered_set<std::string>& seen);
  void define_type(nlohmann::json const& entry);
  TypeId resolve_ref(nlohmann::json const& ref);
  TypeId resolve_named(std::string_view text);
  std::optional<std::string> load_function(nlohmann::json const& entry);
  DecompRecord load_record(FunctionInfo const& info, nlohmann::json const& out);

public:
  // Returns the reason on failure
  std::optional<std::string> load_from(std::istream& source);

  // Problems in the database that did not stop it from loading
  Diagnostics const& load_diagnostics() const { return _load_diags; }

  TypeGraph const& types() const override { return _graph; }
  std::vector<FunctionInfo> list_functions() const override { return _functions; }
  ErrorOr<DecompRecord> decompile(uint64_t address) const override;
  std::string_view program_name() const override { return _program; }

  virtual ~JsonProgramSource() {}
};
}  // namespace tuslice
