#include <doctest/doctest.h>

#include <sstream>
#include <string>

#include "TestFixtures.hh"
#include "render/TypeWriter.hh"

using namespace tuslice;
using namespace tuslice::test;

namespace {
template <typename Fn>
std::string capture(Fn&& fn) {
  std::ostringstream out;
  FormatPrinter printer(out, 2);
  fn(printer);
  return out.str();
}

TypeId void_type(TypeGraph& graph) { return graph.primitive("void", 0, false, false); }
}  // namespace

TEST_CASE("Test declarators") {
  TypeGraph graph;
  TypeId i32 = int_type(graph);
  TypeId chr = graph.primitive("char", 1, true, false);
  TypeId node = make_linked_list(graph);
  TypeWriter writer(graph);

  CHECK(writer.declare(graph.pointer_to(i32), "p") == "int *p");
  CHECK(writer.declare(graph.pointer_to(graph.pointer_to(chr)), "argv") == "char **argv");
  CHECK(writer.declare(graph.array_of(graph.pointer_to(i32), 3), "arr") == "int *arr[3]");
  CHECK(writer.declare(graph.pointer_to(graph.array_of(i32, 4)), "p") == "int (*p)[4]");
  CHECK(writer.declare(graph.array_of(graph.array_of(i32, 2), 3), "grid") == "int grid[3][2]");
  CHECK(writer.declare(graph.array_of(chr, 0), "tail") == "char tail[]");
  CHECK(writer.declare(kInvalidTypeId, "x") == "void x");
  CHECK(writer.type_name(graph.pointer_to(node)) == "Node *");
  CHECK(writer.type_name(i32) == "int");
}

TEST_CASE("Test function pointer declarators") {
  TypeGraph graph;
  TypeId i32 = int_type(graph);
  TypeId chr = graph.primitive("char", 1, true, false);
  TypeId node = make_linked_list(graph);
  TypeWriter writer(graph);

  TypeId cb = graph.function(void_type(graph), {graph.pointer_to(node), i32}, false);
  CHECK(writer.declare(graph.pointer_to(cb), "cb") == "void (*cb)(Node *, int)");
  CHECK(writer.declare(cb, "Callback") == "void Callback(Node *, int)");

  TypeId noargs = graph.function(i32, {}, false);
  CHECK(writer.declare(graph.pointer_to(noargs), "f") == "int (*f)(void)");

  TypeId printf_like = graph.function(i32, {graph.pointer_to(chr)}, true);
  CHECK(writer.declare(graph.pointer_to(printf_like), "log") == "int (*log)(char *, ...)");

  TypeId table = graph.array_of(graph.pointer_to(noargs), 4);
  CHECK(writer.declare(table, "handlers") == "int (*handlers[4])(void)");
}

TEST_CASE("Test composite bodies") {
  TypeGraph graph;
  TypeId node = make_linked_list(graph);
  TypeId empty = graph.declare_composite(CompositeKind::kStruct, "Empty");
  graph.define_composite(empty, {});
  TypeId pending = graph.declare_composite(CompositeKind::kUnion, "Pending");
  TypeId unnamed = graph.declare_composite(CompositeKind::kUnion, "Value");
  graph.define_composite(unnamed, {{"", int_type(graph)}, {"raw", kInvalidTypeId}});
  TypeWriter writer(graph);

  CHECK(capture([&](FormatPrinter& p) { writer.write_composite(node, p); }) ==
        "struct Node {\n  int value;\n  Node *next;\n};\n");
  CHECK(capture([&](FormatPrinter& p) { writer.write_composite(empty, p); }) ==
        "struct Empty {\n  unsigned char _placeholder;\n};\n");
  CHECK(capture([&](FormatPrinter& p) { writer.write_composite(pending, p); }).empty());
  CHECK(capture([&](FormatPrinter& p) { writer.write_composite(unnamed, p); }) ==
        "union Value {\n  int field_0;\n  unsigned char raw;\n};\n");
  CHECK(capture([&](FormatPrinter& p) { writer.write_forward(pending, p); }) == "typedef union Pending Pending;\n");
}

TEST_CASE("Test enums and opaque types") {
  TypeGraph graph;
  TypeId color = graph.declare_enum("Color", 4);
  graph.define_enum(color, {{"RED", 0}, {"GREEN", 1}});
  TypeId flags = graph.declare_enum("Flags", 2);
  TypeWriter writer(graph);

  CHECK(capture([&](FormatPrinter& p) { writer.write_enum(color, p); }) ==
        "typedef enum Color {\n  RED = 0,\n  GREEN = 1\n} Color;\n");
  CHECK(capture([&](FormatPrinter& p) { writer.write_enum(flags, p); }) == "typedef unsigned short Flags;\n");
  CHECK(capture([&](FormatPrinter& p) { writer.write_opaque(graph.opaque("HANDLE", 0), p); }) ==
        "typedef unsigned char HANDLE;\n");
  CHECK(capture([&](FormatPrinter& p) { writer.write_opaque(graph.opaque("BLOB", 8), p); }) ==
        "typedef struct { unsigned char _data[8]; } BLOB;\n");
  CHECK(writer.declare(graph.function(graph.opaque("BLOB", 8), {}, false), "read_blob") == "BLOB read_blob(void)");
}

TEST_CASE("Test primitive typedefs") {
  TypeGraph graph;
  TypeWriter writer(graph);
  auto prim = [&](std::string_view name, uint32_t size, bool is_signed, bool floating) {
    TypeId id = graph.primitive(name, size, is_signed, floating);
    return capture([&](FormatPrinter& p) { writer.write_primitive(id, p); });
  };

  CHECK(prim("int", 4, true, false).empty());
  CHECK(prim("unsigned char", 1, false, false).empty());
  CHECK(prim("uint", 4, false, false) == "typedef unsigned int uint;\n");
  CHECK(prim("undefined1", 1, false, false) == "typedef unsigned char undefined1;\n");
  CHECK(prim("sword", 2, true, false) == "typedef short sword;\n");
  CHECK(prim("ulonglong", 8, false, false) == "typedef unsigned long long ulonglong;\n");
  CHECK(prim("float8", 8, true, true) == "typedef double float8;\n");
  CHECK(prim("code", 0, false, false) == "typedef void code;\n");
  CHECK(contains(prim("bool", 1, false, false), "typedef unsigned char bool;"));
}

TEST_CASE("Test typedefs") {
  TypeGraph graph;
  TypeId i32 = int_type(graph);
  TypeId node = make_linked_list(graph);
  TypeId node_ptr = graph.declare_typedef("NodePtr");
  graph.define_typedef(node_ptr, graph.pointer_to(node));
  TypeId same = graph.declare_typedef("Node");
  graph.define_typedef(same, node);
  TypeId cb = graph.declare_typedef("Callback");
  graph.define_typedef(cb, graph.function(void_type(graph), {graph.pointer_to(node), i32}, false));
  TypeId dangling = graph.declare_typedef("Dangling");
  TypeWriter writer(graph);

  CHECK(capture([&](FormatPrinter& p) { writer.write_typedef(node_ptr, p); }) == "typedef Node *NodePtr;\n");
  CHECK(capture([&](FormatPrinter& p) { writer.write_typedef(cb, p); }) == "typedef void Callback(Node *, int);\n");
  CHECK(capture([&](FormatPrinter& p) { writer.write_typedef(dangling, p); }) ==
        "typedef unsigned char Dangling;\n");
  CHECK(writer.is_redundant_typedef(same));
  CHECK(capture([&](FormatPrinter& p) { writer.write_typedef(same, p); }).empty());
  CHECK_FALSE(writer.is_redundant_typedef(node_ptr));
}

TEST_CASE("Test prelude") {
  std::string prelude = capture([](FormatPrinter& p) { write_prelude(p); });

  CHECK(contains(prelude, "typedef unsigned long long unkuint9;"));
  CHECK(contains(prelude, "typedef long long unkint16;"));
  CHECK(contains(prelude, "typedef unsigned long long unkbyte12;"));
  CHECK(contains(prelude, "typedef float unkfloat1;"));
  CHECK(contains(prelude, "typedef double unkfloat6;"));
  CHECK(contains(prelude, "typedef long double unkfloat16;"));
  CHECK(contains(prelude, "typedef void BADSPACEBASE;"));
  CHECK(contains(prelude, "typedef void code;"));
  CHECK(contains(prelude, "typedef unsigned char bool;"));

  CHECK(is_prelude_type("unkint12"));
  CHECK(is_prelude_type("unkfloat7"));
  CHECK(is_prelude_type("BADSPACEBASE"));
  CHECK_FALSE(is_prelude_type("unkint17"));
  CHECK_FALSE(is_prelude_type("unkuint8"));
  CHECK_FALSE(is_prelude_type("unkfloat4"));
  CHECK_FALSE(is_prelude_type("unkfloat10"));
  CHECK_FALSE(is_prelude_type("uint"));

  CHECK(is_native_c_type("unsigned char"));
  CHECK(is_native_c_type("long double"));
  CHECK_FALSE(is_native_c_type("uint"));
}
