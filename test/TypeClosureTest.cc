#include <doctest/doctest.h>

#include <vector>

#include "TestFixtures.hh"
#include "closure/TypeClosure.hh"

using namespace tuslice;
using namespace tuslice::test;

namespace {
std::vector<TypeId> closure_order(OrderedTable<TypeId, EntryState> const& acc) {
  std::vector<TypeId> ret;
  for (auto const& [id, state] : acc) {
    ret.push_back(id);
  }
  return ret;
}

bool all_resolved(OrderedTable<TypeId, EntryState> const& acc) {
  for (auto const& [id, state] : acc) {
    if (state != EntryState::kResolved) {
      return false;
    }
  }
  return true;
}
}  // namespace

TEST_CASE("Test closure of a self-referential struct terminates") {
  TypeGraph graph;
  TypeId node = make_linked_list(graph);
  TypeId node_ptr = graph.pointer_to(node);

  OrderedTable<TypeId, EntryState> acc;
  Diagnostics diags;
  close_type(graph, node_ptr, acc, diags);

  std::vector<TypeId> expected = {node_ptr, node, int_type(graph)};
  CHECK(closure_order(acc) == expected);
  CHECK(all_resolved(acc));
  CHECK(diags.empty());
}

TEST_CASE("Test closure of mutually referencing structs terminates") {
  TypeGraph graph;
  TypeId a = graph.declare_composite(CompositeKind::kStruct, "A");
  TypeId b = graph.declare_composite(CompositeKind::kStruct, "B");
  graph.define_composite(a, {{"b", graph.pointer_to(b)}});
  graph.define_composite(b, {{"a", graph.pointer_to(a)}});

  OrderedTable<TypeId, EntryState> acc;
  Diagnostics diags;
  close_type(graph, a, acc, diags);

  CHECK(acc.size() == 4);
  CHECK(acc.contains(a));
  CHECK(acc.contains(b));
  CHECK(acc.position(a) < acc.position(b));
  CHECK(all_resolved(acc));

  // Closing again adds nothing
  close_type(graph, b, acc, diags);
  CHECK(acc.size() == 4);
}

TEST_CASE("Test closure walks typedefs arrays and function types") {
  TypeGraph graph;
  TypeId i32 = int_type(graph);
  TypeId node = make_linked_list(graph);
  TypeId cb = graph.function(graph.primitive("void", 0, false, false), {graph.pointer_to(node), i32}, false);
  TypeId cb_t = graph.declare_typedef("Callback");
  graph.define_typedef(cb_t, cb);
  TypeId table = graph.array_of(graph.pointer_to(cb_t), 8);

  OrderedTable<TypeId, EntryState> acc;
  Diagnostics diags;
  close_type(graph, table, acc, diags);

  CHECK(acc.contains(cb_t));
  CHECK(acc.contains(cb));
  CHECK(acc.contains(node));
  CHECK(acc.contains(i32));
  CHECK(acc.position(table) == 0);
}

TEST_CASE("Test opaque field is reported") {
  TypeGraph graph;
  TypeId holder = graph.declare_composite(CompositeKind::kStruct, "Holder");
  graph.define_composite(holder, {{"h", graph.pointer_to(graph.opaque("HANDLE", 0))}, {"missing", kInvalidTypeId}});

  OrderedTable<TypeId, EntryState> acc;
  Diagnostics diags;
  close_type(graph, holder, acc, diags);

  CHECK(diags.count(DiagKind::kOpaqueType) == 2);
  CHECK(acc.contains(graph.opaque("HANDLE", 0)));
}

TEST_CASE("Test invalid root is ignored") {
  TypeGraph graph;
  OrderedTable<TypeId, EntryState> acc;
  Diagnostics diags;
  close_type(graph, kInvalidTypeId, acc, diags);
  CHECK(acc.empty());
  CHECK(diags.empty());
}

TEST_CASE("Test underlying type strips wrappers") {
  TypeGraph graph;
  TypeId node = make_linked_list(graph);
  TypeId alias = graph.declare_typedef("NodePtr");
  graph.define_typedef(alias, graph.pointer_to(node));

  CHECK(underlying_type(graph, graph.array_of(alias, 3)) == node);
  CHECK(underlying_type(graph, node) == node);
  CHECK(underlying_type(graph, kInvalidTypeId) == kInvalidTypeId);

  TypeId loop = graph.declare_typedef("Loop");
  graph.define_typedef(loop, loop);
  CHECK(underlying_type(graph, loop) == kInvalidTypeId);
}
