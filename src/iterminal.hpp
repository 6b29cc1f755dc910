#pragma once
/*
 * ITerminal
 *
 * Purpose: abstract terminal backend (size, draw, frames, cursor, refresh, keys).
 * Goal: decouple from concrete impls (ncurses/headless), enable testing.
 * Keys: read_key returns the K_* codes from types.hpp or plain characters.
 */
#include <string>
#include "types.hpp"

struct TermSize { int rows; int cols; };

class ITerminal {
public:
  virtual ~ITerminal() = default;
  virtual TermSize getSize() const = 0;
  virtual void clear() = 0;
  virtual void draw_text(int row, int col, const std::string& text) = 0;
  virtual void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) = 0;
  virtual void draw_colored(int row, int col, const std::string& text, int color_pair_id) = 0;
  virtual void draw_frame(int row, int col, int height, int width, const std::string& title, bool active) = 0;
  virtual void move_cursor(int row, int col) = 0;
  virtual void show_cursor(bool visible) = 0;
  virtual void refresh() = 0;
  virtual void enable_mouse(bool on) = 0;
  // K_NONE when nothing arrived within timeout_ms
  virtual int read_key(int timeout_ms) = 0;
  virtual MouseEvent last_mouse() const = 0;
};
