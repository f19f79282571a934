#include "model/Diagnostics.hh"

#include <fmt/format.h>

#include <algorithm>

namespace tuslice {
void Diagnostics::warn(DiagKind kind, std::string subject, std::string message) {
  _list.push_back(Diagnostic{kind, std::move(subject), std::move(message)});
}

void Diagnostics::append(Diagnostics const& other) {
  _list.insert(_list.end(), other._list.begin(), other._list.end());
}

size_t Diagnostics::count(DiagKind kind) const {
  return std::count_if(_list.begin(), _list.end(), [kind](Diagnostic const& d) { return d._kind == kind; });
}

bool Diagnostics::has_conflicts() const {
  return count(DiagKind::kGlobalConflict) + count(DiagKind::kSignatureConflict) + count(DiagKind::kEquateConflict) >
         0;
}

std::string_view diag_kind_str(DiagKind kind) {
  switch (kind) {
    case DiagKind::kDecompileFailure:
      return "decompile-failure";
    case DiagKind::kGlobalConflict:
      return "global-conflict";
    case DiagKind::kSignatureConflict:
      return "signature-conflict";
    case DiagKind::kEquateConflict:
      return "equate-conflict";
    case DiagKind::kOpaqueType:
      return "opaque-type";
    case DiagKind::kMissingSignature:
      return "missing-signature";
    case DiagKind::kUnknownCallee:
      return "unknown-callee";
    case DiagKind::kUnknownType:
      return "unknown-type";
    case DiagKind::kDuplicateType:
      return "duplicate-type";
    case DiagKind::kUnmatchedFilter:
      return "unmatched-filter";
    case DiagKind::kBadAddressRange:
      return "bad-address-range";
    case DiagKind::kTypeCycle:
      return "type-cycle";
  }
  return "unknown";
}

std::string format_diagnostic(Diagnostic const& diag) {
  return fmt::format("[{}] {}: {}", diag_kind_str(diag._kind), diag._subject, diag._message);
}
}  // namespace tuslice
