#include "node.hpp"
#include "errors.hpp"
#include "test_util.hpp"
#include <cassert>
#include <string>

static void test_root_and_cache() {
  FakeReader r;
  fill_sample(r);
  NodeStore store(r, 1000);
  NodeId root = store.create_root();
  assert(store.at(root).name == "test.h5");
  assert(store.at(root).path == "/");
  assert(store.at(root).is_container());
  assert(store.at(root).has_children);
  assert(!store.at(root).children);

  const auto& kids = store.expand(root);
  assert(kids.size() == 2);
  assert(r.list_calls == 1);
  assert(store.at(kids[0]).path == "/alpha");
  assert(store.at(kids[0]).depth == 1);
  assert(store.at(kids[0]).parent == root);
  assert(store.at(kids[1]).kind == NodeKind::Leaf);
  std::size_t before = store.size();
  store.expand(root);
  assert(r.list_calls == 1);
  assert(store.size() == before);
}

static void test_expand_failure_caches_nothing() {
  FakeReader r;
  fill_sample(r);
  NodeStore store(r, 1000);
  NodeId root = store.create_root();
  r.fail_on("/");
  assert(throws_as<ReadError>([&] { store.expand(root); }));
  assert(!store.at(root).children);
  assert(store.size() == 1);
  r.heal("/");
  assert(store.expand(root).size() == 2);
}

static void test_values() {
  FakeReader r;
  fill_sample(r);
  NodeStore store(r, 1000);
  NodeId root = store.create_root();
  NodeId alpha = store.expand(root)[0];
  NodeId beta = store.expand(root)[1];

  assert(store.value_text(beta, IndexRange{2, 5}) == "2\n3\n4");
  assert(store.value_text(beta, IndexRange{8, 50}) == "8\n9");
  assert(throws_as<InvalidUserInput>([&] { store.value_text(beta, IndexRange{10, 12}); }));
  assert(throws_as<InvalidUserInput>([&] { store.value_text(beta, IndexRange{4, 4}); }));
  assert(throws_as<InvalidUserInput>([&] { store.value_text(alpha); }));

  store.set_values_cap(3);
  assert(store.value_text(beta) == "0\n1\n2\n... truncated to 3 of 10 elements");
  assert(store.value_text(beta, IndexRange{2, 5}) == "2\n3\n4");
  assert(store.value_text(beta, IndexRange{2, 100}) == "2\n3\n4\n... truncated to 3 of 8 elements");
}

static void test_values_cap_counts_elements() {
  FakeReader r;
  r.add_shaped("/wide", {200, 1000000});
  r.add_shaped("/grid", {10, 4, 5});
  NodeStore store(r, 100);
  NodeId root = store.create_root();
  NodeId grid = store.expand(root)[0];
  NodeId wide = store.expand(root)[1];

  // rows of a million elements each: one row is the smallest window
  std::string w = store.value_text(wide);
  assert(r.last_start == 0 && r.last_end == 1);
  assert(w == "[0, 1, 2, 3, ...]\n... truncated to 1 of 200 rows (1000000 elements per row)");
  store.value_text(wide, IndexRange{5, 150});
  assert(r.last_start == 5 && r.last_end == 6);

  // 20 elements per row under a cap of 100 leaves five rows
  std::string g = store.value_text(grid);
  assert(r.last_end - r.last_start == 5);
  assert(g.find("... truncated to 5 of 10 rows (20 elements per row)") != std::string::npos);
  store.value_text(grid, IndexRange{2, 6});
  assert(r.last_start == 2 && r.last_end == 6);
  assert(store.value_text(grid, IndexRange{2, 6}).find("truncated") == std::string::npos);
}

static void test_passthrough() {
  FakeReader r;
  fill_sample(r);
  r.set_attributes("/beta", "units: m");
  NodeStore store(r, 1000);
  NodeId root = store.create_root();
  NodeId beta = store.expand(root)[1];
  assert(store.metadata_text(beta) == "Dataset: /beta");
  assert(store.attribute_text(beta) == "units: m");
  assert(store.attribute_text(root) == "No attributes");
}

int main() {
  test_root_and_cache();
  test_expand_failure_caches_nothing();
  test_values();
  test_values_cap_counts_elements();
  test_passthrough();
  return 0;
}
