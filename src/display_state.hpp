#pragma once
/*
 * DisplayState
 *
 * Purpose: IDisplaySurface shared by the UI thread and the poll thread.
 * Threading: cursor offset, focus and the redraw flag are atomics; pane texts and
 * titles sit behind one mutex and are copied out whole.
 */
#include <array>
#include <atomic>
#include <mutex>
#include <string>
#include "i_display_surface.hpp"

class DisplayState : public IDisplaySurface {
public:
  std::size_t cursor_offset() const override { return cursor_offset_.load(); }
  void set_cursor_offset(std::size_t offset) override { cursor_offset_.store(offset); invalidate(); }
  void set_pane_text(PaneId pane, std::string text) override;
  std::string pane_text(PaneId pane) const override;
  void focus(PaneId pane) override { focus_.store(pane); invalidate(); }
  PaneId focused() const override { return focus_.load(); }
  void invalidate() override { dirty_.store(true); }

  void set_pane_title(PaneId pane, std::string title);
  std::string pane_title(PaneId pane) const;
  // returns the redraw flag and clears it
  bool take_invalidated() { return dirty_.exchange(false); }

private:
  std::atomic<std::size_t> cursor_offset_{0};
  std::atomic<PaneId> focus_{PaneId::Tree};
  std::atomic<bool> dirty_{true};
  mutable std::mutex mu_;
  std::array<std::string, PANE_COUNT> texts_;
  std::array<std::string, PANE_COUNT> titles_;
};
