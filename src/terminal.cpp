#include "terminal.hpp"
#include <locale.h>

Terminal::Terminal() {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  set_escdelay(25);
  mouseinterval(0);
  curs_set(0);
}

Terminal::~Terminal() {
  mousemask(0, nullptr);
  curs_set(1);
  endwin();
}
