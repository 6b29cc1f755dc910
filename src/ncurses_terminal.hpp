#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing and input mode.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 */
#include "iterminal.hpp"
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  ~NcursesTerminal();
  TermSize getSize() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void draw_frame(int row, int col, int height, int width, const std::string& title, bool active) override;
  void move_cursor(int row, int col) override;
  void show_cursor(bool visible) override;
  void refresh() override;
  void enable_mouse(bool on) override;
  int read_key(int timeout_ms) override;
  MouseEvent last_mouse() const override { return mouse_; }
private:
  MouseEvent mouse_;
};
