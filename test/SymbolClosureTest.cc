#include <doctest/doctest.h>

#include <string>
#include <unordered_set>
#include <vector>

#include "TestFixtures.hh"
#include "closure/SymbolClosure.hh"

using namespace tuslice;
using namespace tuslice::test;

namespace {
FunctionInfo make_fn(uint64_t address, std::string name, std::string signature) {
  return FunctionInfo{._address = address, ._name = std::move(name), ._signature = std::move(signature)};
}

std::vector<FunctionInfo> universe() {
  FunctionInfo thunk = make_fn(0x1300, "thunk_puts", "int thunk_puts(char *s)");
  thunk._thunk_of = 0x5000;
  FunctionInfo puts = make_fn(0x5000, "puts", "int puts(char *s)");
  puts._external = true;

  return {
    make_fn(0x1000, "main", "int main(void)"),
    make_fn(0x1100, "helper", "void helper(int x)"),
    make_fn(0x1200, "noproto", ""),
    thunk,
    puts,
  };
}

DecompRecord record_of(uint64_t address, std::string name) {
  return DecompRecord{._address = address, ._name = std::move(name), ._signature = "void f(void)"};
}
}  // namespace

TEST_CASE("Test signature normalization") {
  CHECK(normalize_signature("int f(void)") == "int f(void);");
  CHECK(normalize_signature("  int f(void) ;; ") == "int f(void);");
  CHECK(normalize_signature("int f(void);") == "int f(void);");
  CHECK(normalize_signature("   ").empty());
  CHECK(normalize_signature(";").empty());
  CHECK(missing_signature_comment("noproto") == "/* WARNING: Could not decompile function noproto */");
}

TEST_CASE("Test function index lookups and thunks") {
  FunctionIndex index(universe());

  REQUIRE(index.by_address(0x1100) != nullptr);
  CHECK(index.by_address(0x1100)->_name == "helper");
  CHECK(index.by_name("thunk_puts")->_address == 0x1300);
  CHECK(index.by_address(0x9999) == nullptr);
  CHECK(index.resolve_thunk(index.by_name("thunk_puts"))->_name == "puts");
  CHECK(index.resolve_thunk(index.by_name("main"))->_name == "main");
  CHECK(index.resolve_thunk(nullptr) == nullptr);
}

TEST_CASE("Test thunk loops and broken links stop") {
  FunctionInfo a = make_fn(0x10, "a", "");
  a._thunk_of = 0x20;
  FunctionInfo b = make_fn(0x20, "b", "");
  b._thunk_of = 0x10;
  FunctionInfo c = make_fn(0x30, "c", "");
  c._thunk_of = 0x999;
  FunctionIndex index({a, b, c});

  CHECK(index.resolve_thunk(index.by_name("a")) != nullptr);
  CHECK(index.resolve_thunk(index.by_name("c"))->_name == "c");
}

TEST_CASE("Test callees are declared and selected functions are not") {
  FunctionIndex index(universe());
  std::unordered_set<uint64_t> selected = {0x1000};
  SymbolContext ctx{index, selected};

  DecompRecord rec = record_of(0x1000, "main");
  rec._calls = {
    CallRef{._callee = 0x1100},
    CallRef{._callee = 0x1000},
    CallRef{._callee = 0x1300},
  };

  DeclarationSet acc;
  Diagnostics diags;
  close_symbols(rec, ctx, acc, diags);

  CHECK(acc._functions.size() == 2);
  REQUIRE(acc._functions.contains("helper"));
  CHECK(acc._functions.find("helper")->_signature == "void helper(int x);");
  // The thunk is declared under the name of what it jumps to
  REQUIRE(acc._functions.contains("puts"));
  CHECK(acc._functions.find("puts")->_signature == "int puts(char *s);");
  CHECK_FALSE(acc._functions.contains("main"));
  CHECK(diags.empty());
}

TEST_CASE("Test call site signature wins over the listing") {
  FunctionIndex index(universe());
  std::unordered_set<uint64_t> selected;
  SymbolContext ctx{index, selected};

  DecompRecord rec = record_of(0x1000, "main");
  rec._calls = {CallRef{._callee = 0x1100, ._signature = "void helper(unsigned int x)"}};

  DeclarationSet acc;
  Diagnostics diags;
  close_symbols(rec, ctx, acc, diags);
  CHECK(acc._functions.find("helper")->_signature == "void helper(unsigned int x);");
}

TEST_CASE("Test missing and unknown callees") {
  FunctionIndex index(universe());
  std::unordered_set<uint64_t> selected;
  SymbolContext ctx{index, selected};

  DecompRecord rec = record_of(0x1000, "main");
  rec._calls = {
    CallRef{._callee = 0x1200},
    CallRef{._callee = 0x1200},
    CallRef{._callee = 0x7777},
    CallRef{._callee = 0x8888, ._name = "memcpy"},
  };

  DeclarationSet acc;
  Diagnostics diags;
  close_symbols(rec, ctx, acc, diags);

  REQUIRE(acc._functions.contains("noproto"));
  CHECK(acc._functions.find("noproto")->_signature.empty());
  CHECK(acc._functions.contains("memcpy"));
  CHECK(diags.count(DiagKind::kMissingSignature) == 2);
  CHECK(diags.count(DiagKind::kUnknownCallee) == 1);
}

TEST_CASE("Test function storage globals become declarations") {
  FunctionIndex index(universe());
  std::unordered_set<uint64_t> selected;
  SymbolContext ctx{index, selected};

  DecompRecord rec = record_of(0x1000, "main");
  rec._globals = {
    GlobalRef{._name = "helper", ._type = kInvalidTypeId, ._storage = GlobalStorage::kFunction, ._address = 0x1100},
  };

  DeclarationSet acc;
  Diagnostics diags;
  close_symbols(rec, ctx, acc, diags);
  CHECK(acc._globals.empty());
  CHECK(acc._functions.contains("helper"));
}

TEST_CASE("Test conflicts keep the first sighting") {
  TypeGraph graph;
  TypeId i32 = int_type(graph);
  TypeId u32 = graph.primitive("uint", 4, false, false);
  FunctionIndex index(universe());
  std::unordered_set<uint64_t> selected;
  SymbolContext ctx{index, selected};

  DecompRecord first = record_of(0x1000, "main");
  first._globals = {GlobalRef{._name = "g_count", ._type = i32, ._quals = Qualifiers::kNone}};
  first._equates = {EquateRef{"MAX", "16"}};
  first._calls = {CallRef{._callee = 0x1100, ._signature = "void helper(int x)"}};

  DecompRecord second = record_of(0x1000, "main");
  second._globals = {GlobalRef{._name = "g_count", ._type = u32, ._quals = Qualifiers::kVolatile}};
  second._equates = {EquateRef{"MAX", "32"}, EquateRef{"MIN", "0"}};
  second._calls = {CallRef{._callee = 0x1100, ._signature = "void helper(long x)"}};

  DeclarationSet a;
  DeclarationSet b;
  Diagnostics diags;
  close_symbols(first, ctx, a, diags);
  close_symbols(second, ctx, b, diags);
  CHECK(diags.empty());

  merge_declarations(a, b, diags);
  CHECK(a._globals.find("g_count")->_type == i32);
  CHECK(a._equates.find("MAX")->_value == "16");
  CHECK(a._equates.contains("MIN"));
  CHECK(a._functions.find("helper")->_signature == "void helper(int x);");
  CHECK(diags.count(DiagKind::kGlobalConflict) == 1);
  CHECK(diags.count(DiagKind::kEquateConflict) == 1);
  CHECK(diags.count(DiagKind::kSignatureConflict) == 1);
  CHECK(diags.has_conflicts());
}

TEST_CASE("Test empty signature is filled in by a later sighting") {
  FunctionIndex index(universe());
  std::unordered_set<uint64_t> selected;
  SymbolContext ctx{index, selected};

  DecompRecord first = record_of(0x1000, "main");
  first._calls = {CallRef{._callee = 0x1200}};
  DecompRecord second = record_of(0x1000, "main");
  second._calls = {CallRef{._callee = 0x1200, ._signature = "int noproto(void)"}};

  DeclarationSet a;
  DeclarationSet b;
  Diagnostics diags;
  close_symbols(first, ctx, a, diags);
  close_symbols(second, ctx, b, diags);
  merge_declarations(a, b, diags);

  CHECK(a._functions.find("noproto")->_signature == "int noproto(void);");
  CHECK_FALSE(diags.has_conflicts());
}
