#include "cursor_sync.hpp"
#include "display_state.hpp"
#include "errors.hpp"
#include "test_util.hpp"
#include <cassert>
#include <mutex>
#include <stop_token>
#include <thread>

struct Fixture {
  FakeReader reader;
  NodeStore store{reader, 1000};
  TreeText tree{store};
  DisplayState display;
  std::mutex session;
  CursorSync cursor{tree, store, display, session};
  NodeId root = NO_NODE;

  Fixture() {
    fill_sample(reader);
    root = store.create_root();
    tree.initialize(root);
    tree.expand_node(root, 0);
    tree.expand_node(tree.node_at_row(1), 1);
  }
};

static void test_offsets_round_trip() {
  Fixture f;
  for (int r = 0; r < f.tree.row_count(); ++r) {
    assert(f.cursor.row_of(f.cursor.offset_of_row_start(r)) == r);
  }
  // the newline at the end of a row still belongs to that row
  std::size_t end_of_first = static_cast<std::size_t>(f.tree.line_length(0));
  assert(f.cursor.row_of(end_of_first) == 0);
  assert(f.cursor.row_of(end_of_first + 1) == 1);
  assert(f.cursor.row_of(f.tree.total_length() + 5) == f.tree.row_count());
  assert(f.cursor.offset_of_row_start(99) == f.tree.total_length());
}

static void test_moves_keep_column() {
  Fixture f;
  f.cursor.move_to_row(1);
  f.cursor.move_cols(6);
  assert(f.cursor.current_row() == 1);
  assert(f.cursor.current_col() == 6);
  f.cursor.move_rows(2);
  assert(f.cursor.current_row() == 3);
  assert(f.cursor.current_col() == 6);
  f.cursor.move_rows(-10);
  assert(f.cursor.current_row() == 0);
  f.cursor.move_rows(100);
  assert(f.cursor.current_row() == f.tree.row_count() - 1);
}

static void test_clamp_after_collapse() {
  Fixture f;
  f.cursor.move_to_row(3);
  f.tree.collapse_node(f.root, 0);
  assert(f.tree.row_count() == 1);
  // cursor now points past the buffer; current_row heals it onto the last row
  assert(f.cursor.current_row() == 0);
  assert(f.display.cursor_offset() == 0);

  Fixture g;
  g.cursor.reposition(g.tree.total_length() + 40);
  assert(g.display.cursor_offset() == g.tree.total_length());
  g.cursor.clamp_to_last_row();
  int last = g.tree.row_count() - 1;
  assert(g.display.cursor_offset() == g.tree.total_length() - static_cast<std::size_t>(g.tree.line_length(last)));
  assert(g.cursor.current_row() == last);
}

static void test_poll_refreshes_panes() {
  Fixture f;
  assert(f.cursor.poll_once());
  assert(f.display.pane_text(PaneId::Metadata) == "Group: /");
  assert(!f.cursor.poll_once());
  f.cursor.move_to_row(2);
  assert(f.cursor.poll_once());
  assert(f.display.pane_text(PaneId::Metadata) == "Dataset: /alpha/x");
  assert(f.display.pane_text(PaneId::Attributes) == "No attributes");
  // same row, different node after a structural edit
  f.tree.collapse_node(f.tree.node_at_row(1), 1);
  f.cursor.mark_dirty();
  assert(f.cursor.poll_once());
  assert(f.display.pane_text(PaneId::Metadata) == "Dataset: /beta");
}

static void test_poll_self_heals() {
  Fixture f;
  f.cursor.move_to_row(3);
  f.tree.collapse_node(f.root, 0);
  f.display.set_cursor_offset(f.tree.total_length() + 100);
  assert(f.cursor.poll_once());
  assert(f.display.pane_text(PaneId::Metadata).empty());
  assert(f.cursor.row_of(f.display.cursor_offset()) == 0);
  assert(f.cursor.poll_once());
  assert(f.display.pane_text(PaneId::Metadata) == "Group: /");
}

static void test_poll_reports_read_errors() {
  Fixture f;
  f.cursor.move_to_row(3);
  f.reader.fail_on("/beta");
  assert(f.cursor.poll_once());
  assert(f.display.pane_text(PaneId::Metadata).rfind("ERROR: ", 0) == 0);
}

static void test_poll_survives_other_exceptions() {
  Fixture f;
  f.cursor.move_to_row(3);
  f.reader.break_on("/beta");
  assert(f.cursor.poll_once());
  assert(f.display.pane_text(PaneId::Metadata) == "ERROR: simulated oversized read on /beta");
  assert(f.display.pane_text(PaneId::Attributes).empty());

  // the loop keeps running past the failure and recovers once the reader does
  f.display.set_pane_text(PaneId::Metadata, "");
  f.cursor.mark_dirty();
  std::jthread t([&f](std::stop_token st) { f.cursor.poll_loop(st, std::chrono::milliseconds(1)); });
  while (f.display.pane_text(PaneId::Metadata).empty()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
  assert(f.display.pane_text(PaneId::Metadata).rfind("ERROR: ", 0) == 0);
  {
    std::lock_guard<std::mutex> lk(f.session);
    f.reader.heal("/beta");
    f.cursor.mark_dirty();
  }
  while (f.display.pane_text(PaneId::Metadata) != "Dataset: /beta") std::this_thread::sleep_for(std::chrono::milliseconds(1));
  t.request_stop();
  t.join();
}

static void test_poll_loop_stops() {
  Fixture f;
  std::jthread t([&f](std::stop_token st) { f.cursor.poll_loop(st, std::chrono::milliseconds(1)); });
  while (f.display.pane_text(PaneId::Metadata).empty()) std::this_thread::sleep_for(std::chrono::milliseconds(1));
  t.request_stop();
  t.join();
  assert(f.display.pane_text(PaneId::Metadata) == "Group: /");
}

int main() {
  test_offsets_round_trip();
  test_moves_keep_column();
  test_clamp_after_collapse();
  test_poll_refreshes_panes();
  test_poll_self_heals();
  test_poll_reports_read_errors();
  test_poll_survives_other_exceptions();
  test_poll_loop_stops();
  return 0;
}
