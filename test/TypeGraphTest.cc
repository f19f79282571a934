#include <doctest/doctest.h>

#include <string>

#include "TestFixtures.hh"
#include "model/TypeGraph.hh"

using namespace tuslice;
using namespace tuslice::test;

TEST_CASE("Test structural types intern by children") {
  TypeGraph graph;
  TypeId i32 = int_type(graph);

  CHECK(graph.pointer_to(i32) == graph.pointer_to(i32));
  CHECK(graph.array_of(i32, 4) == graph.array_of(i32, 4));
  CHECK(graph.array_of(i32, 4) != graph.array_of(i32, 8));
  CHECK(graph.function(i32, {i32}, false) == graph.function(i32, {i32}, false));
  CHECK(graph.function(i32, {i32}, false) != graph.function(i32, {i32}, true));
  CHECK(graph.function(i32, {}, false) != graph.function(i32, {i32}, false));
}

TEST_CASE("Test nominal types intern by kind and name") {
  TypeGraph graph;
  TypeId node = graph.declare_composite(CompositeKind::kStruct, "Node");

  CHECK(graph.declare_composite(CompositeKind::kStruct, "Node") == node);
  CHECK(graph.declare_composite(CompositeKind::kUnion, "Node") != node);
  CHECK(graph.find_composite(CompositeKind::kStruct, "Node") == node);
  CHECK(graph.find_composite(CompositeKind::kUnion, "Missing") == kInvalidTypeId);
  CHECK(std::string(graph.name(node)) == "Node");
  CHECK(graph.name(graph.pointer_to(node)).empty());
}

TEST_CASE("Test self reference goes through the name") {
  TypeGraph graph;
  TypeId node = make_linked_list(graph);

  CompositeType const& ct = graph.as<CompositeType>(node);
  REQUIRE(ct._defined);
  REQUIRE(ct._fields.size() == 2);
  CHECK(graph.kind(ct._fields[1]._type) == TypeKind::kPointer);
  CHECK(graph.as<PointerType>(ct._fields[1]._type)._to == node);
}

TEST_CASE("Test find_named prefers typedefs") {
  TypeGraph graph;
  TypeId st = graph.declare_composite(CompositeKind::kStruct, "Handle");
  CHECK(graph.find_named("Handle") == st);

  TypeId td = graph.declare_typedef("Handle");
  graph.define_typedef(td, graph.pointer_to(st));
  CHECK(graph.find_named("Handle") == td);
  CHECK(graph.find_named("Nothing") == kInvalidTypeId);
}

TEST_CASE("Test kinds and keys") {
  TypeGraph graph;
  TypeId i32 = int_type(graph);
  TypeId color = graph.declare_enum("Color", 4);
  graph.define_enum(color, {{"RED", 0}, {"GREEN", 1}});
  TypeId blob = graph.opaque("HANDLE", 0);

  CHECK(graph.kind(i32) == TypeKind::kPrimitive);
  CHECK(graph.kind(color) == TypeKind::kEnum);
  CHECK(graph.kind(blob) == TypeKind::kOpaque);
  CHECK(graph.as<EnumType>(color)._members.size() == 2);
  CHECK(graph.key(graph.pointer_to(i32)) != graph.key(i32));
  CHECK(graph.valid(blob));
  CHECK_FALSE(graph.valid(kInvalidTypeId));
  CHECK(std::string(type_kind_str(TypeKind::kComposite)) == "composite");
}
