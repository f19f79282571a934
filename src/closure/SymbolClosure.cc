#include "closure/SymbolClosure.hh"

#include <fmt/format.h>

#include "utl/StringUtil.hh"

namespace tuslice {
namespace {
std::string_view quals_str(Qualifiers quals) {
  switch (quals) {
    case Qualifiers::kConst:
      return "const";
    case Qualifiers::kVolatile:
      return "volatile";
    case Qualifiers::kAll:
      return "const volatile";
    default:
      return "unqualified";
  }
}

void add_function_decl(FunctionDecl&& decl, DeclarationSet& acc, Diagnostics& diags) {
  FunctionDecl* existing = acc._functions.find(decl._name);
  if (existing == nullptr) {
    acc._functions.insert(decl._name, std::move(decl));
    return;
  }

  if (decl._signature.empty() || existing->_signature == decl._signature) {
    return;
  }
  if (existing->_signature.empty()) {
    // An earlier sighting had nothing to go on, this one does
    existing->_signature = std::move(decl._signature);
    existing->_proto = decl._proto;
    return;
  }
  diags.warn(DiagKind::kSignatureConflict,
    decl._name,
    fmt::format("keeping '{}', ignoring '{}'", existing->_signature, decl._signature));
}

// Declares a function referenced from a body, either called directly or used through its symbol
void declare_callee(std::optional<uint64_t> address,
  std::string_view site_name,
  std::string_view site_signature,
  SymbolContext const& ctx,
  DeclarationSet& acc,
  Diagnostics& diags) {
  FunctionInfo const* target = nullptr;
  if (address) {
    target = ctx._index.by_address(*address);
  }
  if (target == nullptr && !site_name.empty()) {
    target = ctx._index.by_name(site_name);
  }
  target = ctx._index.resolve_thunk(target);

  if (target == nullptr && site_name.empty()) {
    diags.warn(DiagKind::kUnknownCallee,
      address ? format_address(*address) : std::string("<unnamed>"),
      "callee is not a known function and has no name at the call site, skipped");
    return;
  }
  if (target != nullptr && ctx._selected.contains(target->_address)) {
    return;
  }

  FunctionDecl decl{
    ._name = target != nullptr ? target->_name : std::string(site_name),
    ._signature = normalize_signature(site_signature),
    ._proto = target != nullptr ? target->_proto : kInvalidTypeId,
    ._address = target != nullptr ? std::optional<uint64_t>(target->_address) : address,
  };
  if (decl._signature.empty() && target != nullptr) {
    decl._signature = normalize_signature(target->_signature);
  }
  if (decl._signature.empty() && !acc._functions.contains(decl._name)) {
    diags.warn(DiagKind::kMissingSignature, decl._name, "no prototype available, declared as a comment");
  }
  add_function_decl(std::move(decl), acc, diags);
}

void add_global(GlobalDecl const& global, DeclarationSet& acc, Diagnostics& diags) {
  GlobalDecl const* existing = acc._globals.find(global._name);
  if (existing == nullptr) {
    acc._globals.insert(global._name, global);
    return;
  }
  if (existing->_type != global._type || existing->_quals != global._quals) {
    diags.warn(DiagKind::kGlobalConflict,
      global._name,
      fmt::format("referenced with differing type or qualifiers ({} vs {}), keeping the first",
        quals_str(existing->_quals),
        quals_str(global._quals)));
  }
}

void add_equate(EquateDecl const& equate, DeclarationSet& acc, Diagnostics& diags) {
  EquateDecl const* existing = acc._equates.find(equate._name);
  if (existing == nullptr) {
    acc._equates.insert(equate._name, equate);
    return;
  }
  if (existing->_value != equate._value) {
    diags.warn(DiagKind::kEquateConflict,
      equate._name,
      fmt::format("keeping value '{}', ignoring '{}'", existing->_value, equate._value));
  }
}
}  // namespace

FunctionIndex::FunctionIndex(std::vector<FunctionInfo> functions) : _functions(std::move(functions)) {
  for (size_t i = 0; i < _functions.size(); i++) {
    _by_address.emplace(_functions[i]._address, i);
    _by_name.emplace(_functions[i]._name, i);
  }
}

FunctionInfo const* FunctionIndex::by_address(uint64_t address) const {
  auto it = _by_address.find(address);
  return it == _by_address.end() ? nullptr : &_functions[it->second];
}

FunctionInfo const* FunctionIndex::by_name(std::string_view name) const {
  auto it = _by_name.find(std::string(name));
  return it == _by_name.end() ? nullptr : &_functions[it->second];
}

FunctionInfo const* FunctionIndex::resolve_thunk(FunctionInfo const* fn) const {
  for (size_t hops = 0; fn != nullptr && fn->_thunk_of && hops < _functions.size(); hops++) {
    FunctionInfo const* next = by_address(*fn->_thunk_of);
    if (next == nullptr || next == fn) {
      break;
    }
    fn = next;
  }
  return fn;
}

std::string normalize_signature(std::string_view signature) {
  signature = trim(signature);
  while (!signature.empty() && signature.back() == ';') {
    signature.remove_suffix(1);
    signature = trim(signature);
  }
  if (signature.empty()) {
    return {};
  }
  return fmt::format("{};", signature);
}

std::string missing_signature_comment(std::string_view name) {
  return fmt::format("/* WARNING: Could not decompile function {} */", name);
}

void close_symbols(DecompRecord const& record, SymbolContext const& ctx, DeclarationSet& acc, Diagnostics& diags) {
  for (GlobalRef const& global : record._globals) {
    if (global._storage == GlobalStorage::kFunction) {
      declare_callee(global._address, global._name, {}, ctx, acc, diags);
    } else {
      add_global(GlobalDecl{global._name, global._type, global._quals, global._address}, acc, diags);
    }
  }

  for (CallRef const& call : record._calls) {
    declare_callee(call._callee, call._name, call._signature, ctx, acc, diags);
  }

  for (EquateRef const& equate : record._equates) {
    add_equate(EquateDecl{equate._name, equate._value}, acc, diags);
  }
}

void merge_declarations(DeclarationSet& into, DeclarationSet const& from, Diagnostics& diags) {
  for (auto const& [id, state] : from._types) {
    into._types.insert(id, state);
  }
  for (auto const& [name, global] : from._globals) {
    add_global(global, into, diags);
  }
  for (auto const& [name, fn] : from._functions) {
    add_function_decl(FunctionDecl(fn), into, diags);
  }
  for (auto const& [name, equate] : from._equates) {
    add_equate(equate, into, diags);
  }
}
}  // namespace tuslice
