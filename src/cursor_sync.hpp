#pragma once
/*
 * CursorSync
 *
 * Purpose: translate the surface's absolute cursor offset to tree rows and back,
 * keep the cursor on sensible content after expand/collapse, and run the poll
 * loop that refreshes the metadata/attributes panes when the row changes.
 * Threading: poll_once()/poll_loop() take the session mutex themselves; every
 * other member expects the caller (a key handler or the renderer) to hold it.
 * Errors: poll_once() reports every std::exception in the metadata pane.
 */
#include <atomic>
#include <chrono>
#include <cstddef>
#include <mutex>
#include <stop_token>
#include "tree_text.hpp"
#include "node.hpp"
#include "i_display_surface.hpp"

class CursorSync {
public:
  CursorSync(TreeText& tree, NodeStore& store, IDisplaySurface& surface, std::mutex& session);

  // rows past the end of the buffer map to row_count()
  int row_of(std::size_t offset) const;
  std::size_t offset_of_row_start(int row) const;
  void reposition(std::size_t target);

  // self-heals a cursor that drifted past the last row
  int current_row();
  int current_col();
  void move_rows(int delta);
  void move_to_row(int row);
  void move_cols(int delta);
  void clamp_to_last_row();

  void mark_dirty() { last_row_.store(-1); }
  bool poll_once();
  void poll_loop(std::stop_token stop, std::chrono::milliseconds interval);

private:
  TreeText& tree_;
  NodeStore& store_;
  IDisplaySurface& surface_;
  std::mutex& session_;
  std::atomic<int> last_row_{-1};
};
