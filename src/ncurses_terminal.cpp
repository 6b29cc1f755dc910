#include "ncurses_terminal.hpp"
#include <algorithm>

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    if (use_default_colors() == OK) {
      init_pair(1, COLOR_YELLOW, -1); // active frame title
      init_pair(2, -1, -1);
      init_pair(3, COLOR_CYAN, -1);   // hot keys
      init_pair(4, COLOR_RED, -1);    // errors
    } else {
      init_pair(1, COLOR_YELLOW, COLOR_BLACK); // fallback
      init_pair(2, COLOR_WHITE, COLOR_BLACK);
      init_pair(3, COLOR_CYAN, COLOR_BLACK);
      init_pair(4, COLOR_RED, COLOR_BLACK);
    }
  }
}
NcursesTerminal::~NcursesTerminal() {}

TermSize NcursesTerminal::getSize() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (has_colors()) attron(COLOR_PAIR(2));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(2));
}

void NcursesTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = (int)text.size();
  if (hl_start < 0) hl_start = 0;
  if (hl_len < 0) hl_len = 0;
  int hl_end = std::min(len, hl_start + hl_len);
  hl_start = std::min(hl_start, len);
  if (hl_start > 0) {
    mvaddnstr(row, col, text.c_str(), hl_start);
    col += hl_start;
  }
  if (hl_end > hl_start) {
    attron(A_REVERSE);
    mvaddnstr(row, col, text.c_str() + hl_start, hl_end - hl_start);
    attroff(A_REVERSE);
    col += hl_end - hl_start;
  }
  if (hl_end < len) mvaddnstr(row, col, text.c_str() + hl_end, len - hl_end);
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  if (has_colors()) attron(COLOR_PAIR(color_pair_id));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(color_pair_id));
}

void NcursesTerminal::draw_frame(int row, int col, int height, int width, const std::string& title, bool active) {
  if (height < 2 || width < 2) return;
  int bottom = row + height - 1, right = col + width - 1;
  if (active) attron(A_BOLD);
  mvhline(row, col + 1, ACS_HLINE, width - 2);
  mvhline(bottom, col + 1, ACS_HLINE, width - 2);
  mvvline(row + 1, col, ACS_VLINE, height - 2);
  mvvline(row + 1, right, ACS_VLINE, height - 2);
  mvaddch(row, col, ACS_ULCORNER);
  mvaddch(row, right, ACS_URCORNER);
  mvaddch(bottom, col, ACS_LLCORNER);
  mvaddch(bottom, right, ACS_LRCORNER);
  if (active) attroff(A_BOLD);
  if (!title.empty() && width > 6) {
    std::string t = " " + title.substr(0, static_cast<size_t>(width - 6)) + " ";
    if (active) draw_colored(row, col + 2, t, 1);
    else draw_text(row, col + 2, t);
  }
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::show_cursor(bool visible) { curs_set(visible ? 1 : 0); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::enable_mouse(bool on) {
  mousemask(on ? (BUTTON1_CLICKED | BUTTON1_PRESSED | BUTTON4_PRESSED | BUTTON5_PRESSED) : 0, nullptr);
}

int NcursesTerminal::read_key(int timeout_ms) {
  timeout(timeout_ms);
  int ch = getch();
  switch (ch) {
    case ERR: return K_NONE;
    case KEY_UP: return K_UP;
    case KEY_DOWN: return K_DOWN;
    case KEY_LEFT: return K_LEFT;
    case KEY_RIGHT: return K_RIGHT;
    case KEY_HOME: return K_HOME;
    case KEY_END: return K_END;
    case KEY_PPAGE: return K_PAGE_UP;
    case KEY_NPAGE: return K_PAGE_DOWN;
    case KEY_ENTER: case '\r': case '\n': return K_ENTER;
    case KEY_BACKSPACE: case 127: case 8: return K_BACKSPACE;
    case KEY_RESIZE: return K_RESIZE;
    case KEY_MOUSE: {
      MEVENT me;
      mouse_ = MouseEvent{};
      if (getmouse(&me) != OK) return K_NONE;
      mouse_.row = me.y;
      mouse_.col = me.x;
      if (me.bstate & (BUTTON1_CLICKED | BUTTON1_PRESSED)) mouse_.type = MouseEvent::Type::Click;
      #ifdef BUTTON4_PRESSED
      if (me.bstate & BUTTON4_PRESSED) mouse_.type = MouseEvent::Type::WheelUp;
      #endif
      #ifdef BUTTON5_PRESSED
      if (me.bstate & BUTTON5_PRESSED) mouse_.type = MouseEvent::Type::WheelDown;
      #endif
      return K_MOUSE;
    }
    default: return ch;
  }
}
