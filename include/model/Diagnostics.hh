#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace tuslice {
enum class DiagKind {
  kDecompileFailure,
  kGlobalConflict,
  kSignatureConflict,
  kEquateConflict,
  kOpaqueType,
  kMissingSignature,
  kUnknownCallee,
  kUnknownType,
  kDuplicateType,
  kUnmatchedFilter,
  kBadAddressRange,
  kTypeCycle,
};

struct Diagnostic {
  DiagKind _kind;
  // What the diagnostic is about: a function, symbol or type name
  std::string _subject;
  std::string _message;
};

class Diagnostics {
private:
  std::vector<Diagnostic> _list;

public:
  void warn(DiagKind kind, std::string subject, std::string message);
  void append(Diagnostics const& other);

  size_t count(DiagKind kind) const;
  bool has_conflicts() const;

  std::vector<Diagnostic> const& list() const { return _list; }
  size_t size() const { return _list.size(); }
  bool empty() const { return _list.empty(); }
};

std::string_view diag_kind_str(DiagKind kind);
std::string format_diagnostic(Diagnostic const& diag);
}  // namespace tuslice
