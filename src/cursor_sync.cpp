#include "cursor_sync.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <thread>

CursorSync::CursorSync(TreeText& tree, NodeStore& store, IDisplaySurface& surface, std::mutex& session)
    : tree_(tree), store_(store), surface_(surface), session_(session) {}

int CursorSync::row_of(std::size_t offset) const {
  std::size_t acc = 0;
  int rows = tree_.row_count();
  for (int r = 0; r < rows; ++r) {
    acc += static_cast<std::size_t>(tree_.line_length(r)) + 1;
    if (acc > offset) return r;
  }
  return rows;
}

std::size_t CursorSync::offset_of_row_start(int row) const {
  std::size_t acc = 0;
  for (int r = 0; r < row && r < tree_.row_count(); ++r) acc += static_cast<std::size_t>(tree_.line_length(r)) + 1;
  return std::min(acc, tree_.total_length());
}

void CursorSync::reposition(std::size_t target) {
  surface_.set_cursor_offset(std::min(target, tree_.total_length()));
}

void CursorSync::clamp_to_last_row() {
  int last = std::max(0, tree_.row_count() - 1);
  std::size_t total = tree_.total_length();
  std::size_t len = static_cast<std::size_t>(tree_.line_length(last));
  surface_.set_cursor_offset(total > len ? total - len : 0);
}

int CursorSync::current_row() {
  int row = row_of(surface_.cursor_offset());
  if (row >= tree_.row_count()) {
    clamp_to_last_row();
    row = std::max(0, tree_.row_count() - 1);
  }
  return row;
}

int CursorSync::current_col() {
  int row = current_row();
  std::size_t start = offset_of_row_start(row);
  std::size_t off = surface_.cursor_offset();
  int col = off > start ? static_cast<int>(off - start) : 0;
  return std::min(col, tree_.line_length(row));
}

void CursorSync::move_to_row(int row) {
  row = std::clamp(row, 0, std::max(0, tree_.row_count() - 1));
  reposition(offset_of_row_start(row));
}

void CursorSync::move_rows(int delta) {
  int row = current_row();
  int col = current_col();
  int target = std::clamp(row + delta, 0, std::max(0, tree_.row_count() - 1));
  col = std::min(col, tree_.line_length(target));
  reposition(offset_of_row_start(target) + static_cast<std::size_t>(col));
}

void CursorSync::move_cols(int delta) {
  int row = current_row();
  int col = std::clamp(current_col() + delta, 0, tree_.line_length(row));
  reposition(offset_of_row_start(row) + static_cast<std::size_t>(col));
}

bool CursorSync::poll_once() {
  std::lock_guard<std::mutex> lk(session_);
  int row = row_of(surface_.cursor_offset());
  if (row == last_row_.load()) return false;
  last_row_.store(row);
  try {
    NodeId id = tree_.node_at_row(row);
    std::string meta = store_.metadata_text(id);
    std::string attrs = store_.attribute_text(id);
    surface_.set_pane_text(PaneId::Metadata, std::move(meta));
    surface_.set_pane_text(PaneId::Attributes, std::move(attrs));
  } catch (const IndexOutOfRange&) {
    clamp_to_last_row();
    surface_.set_pane_text(PaneId::Metadata, "");
    surface_.set_pane_text(PaneId::Attributes, "");
  } catch (const ReadError& e) {
    spdlog::warn("cannot describe row {}: {}", row, e.what());
    surface_.set_pane_text(PaneId::Metadata, std::string("ERROR: ") + e.what());
    surface_.set_pane_text(PaneId::Attributes, "");
  } catch (const std::exception& e) {
    // nothing may leave the poll thread
    spdlog::error("poll of row {} failed: {}", row, e.what());
    surface_.set_pane_text(PaneId::Metadata, std::string("ERROR: ") + e.what());
    surface_.set_pane_text(PaneId::Attributes, "");
  }
  surface_.invalidate();
  return true;
}

void CursorSync::poll_loop(std::stop_token stop, std::chrono::milliseconds interval) {
  spdlog::debug("poll loop started");
  while (!stop.stop_requested()) {
    poll_once();
    std::this_thread::sleep_for(interval);
  }
  spdlog::debug("poll loop stopped");
}
