#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal for automated tests and render verification.
 * Drawing lands in a character grid (frames drawn with '+', '-', '|');
 * read_key pops from a queue filled by the test, K_NONE when empty.
 */
#include <deque>
#include <string>
#include <vector>
#include "iterminal.hpp"

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols) : rows_(rows), cols_(cols) { clear(); }

  TermSize getSize() const override { return {rows_, cols_}; }
  void clear() override { grid_.assign(static_cast<size_t>(rows_), std::string(static_cast<size_t>(cols_), ' ')); }
  void draw_text(int row, int col, const std::string& text) override { put(row, col, text); }
  void draw_highlighted(int row, int col, const std::string& text, int, int hl_len) override {
    put(row, col, text);
    if (hl_len > 0) highlight_row_ = row;
  }
  void draw_colored(int row, int col, const std::string& text, int) override { put(row, col, text); }
  void draw_frame(int row, int col, int height, int width, const std::string& title, bool active) override {
    if (height < 2 || width < 2) return;
    for (int c = col; c < col + width; ++c) { put(row, c, "-"); put(row + height - 1, c, "-"); }
    for (int r = row; r < row + height; ++r) { put(r, col, "|"); put(r, col + width - 1, "|"); }
    put(row, col, "+"); put(row, col + width - 1, "+");
    put(row + height - 1, col, "+"); put(row + height - 1, col + width - 1, "+");
    if (!title.empty() && width > 6) put(row, col + 2, (active ? "*" : " ") + title.substr(0, static_cast<size_t>(width - 6)) + " ");
  }
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void show_cursor(bool visible) override { cursor_visible_ = visible; }
  void refresh() override { refreshes_++; }
  void enable_mouse(bool on) override { mouse_enabled_ = on; }
  int read_key(int) override {
    if (keys_.empty()) return K_NONE;
    int k = keys_.front();
    keys_.pop_front();
    return k;
  }
  MouseEvent last_mouse() const override { return mouse_; }

  void push_key(int k) { keys_.push_back(k); }
  void push_keys(const std::string& s) { for (char c : s) keys_.push_back(static_cast<unsigned char>(c)); }
  void push_mouse(MouseEvent ev) { mouse_ = ev; keys_.push_back(K_MOUSE); }
  void resize(int rows, int cols) { rows_ = rows; cols_ = cols; clear(); }

  const std::string& row_text(int row) const { return grid_.at(static_cast<size_t>(row)); }
  bool contains(const std::string& s) const {
    for (const auto& r : grid_) if (r.find(s) != std::string::npos) return true;
    return false;
  }
  int find_row(const std::string& s) const {
    for (size_t i = 0; i < grid_.size(); ++i) if (grid_[i].find(s) != std::string::npos) return static_cast<int>(i);
    return -1;
  }
  int highlight_row() const { return highlight_row_; }
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  bool cursor_visible() const { return cursor_visible_; }
  bool mouse_enabled() const { return mouse_enabled_; }
  int refreshes() const { return refreshes_; }

private:
  void put(int row, int col, const std::string& text) {
    if (row < 0 || row >= rows_) return;
    std::string& line = grid_[static_cast<size_t>(row)];
    for (size_t i = 0; i < text.size(); ++i) {
      int c = col + static_cast<int>(i);
      if (c < 0) continue;
      if (c >= cols_) break;
      line[static_cast<size_t>(c)] = text[i];
    }
  }

  int rows_, cols_;
  std::vector<std::string> grid_;
  std::deque<int> keys_;
  MouseEvent mouse_;
  int highlight_row_ = -1;
  int cursor_row_ = 0, cursor_col_ = 0;
  bool cursor_visible_ = false;
  bool mouse_enabled_ = false;
  int refreshes_ = 0;
};
