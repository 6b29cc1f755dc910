#pragma once
/*
 * IDisplaySurface
 *
 * Purpose: what the core needs from the UI toolkit: the tree cursor (an absolute
 * offset into TreeText::text()), whole-text pane updates, focus and redraw.
 * Constraint: pane text is only ever replaced whole, never edited in place.
 */
#include <cstddef>
#include <string>
#include "types.hpp"

class IDisplaySurface {
public:
  virtual ~IDisplaySurface() = default;
  virtual std::size_t cursor_offset() const = 0;
  virtual void set_cursor_offset(std::size_t offset) = 0;
  virtual void set_pane_text(PaneId pane, std::string text) = 0;
  virtual std::string pane_text(PaneId pane) const = 0;
  virtual void focus(PaneId pane) = 0;
  virtual PaneId focused() const = 0;
  virtual void invalidate() = 0;
};
