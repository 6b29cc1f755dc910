#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown for the explorer session.
 * Usage: construct in main after the file opened and before any NcursesTerminal;
 *        the destructor releases the mouse, shows the cursor and ends curses mode.
 * Note: raw mode so Ctrl-C arrives as a key and quits through the App.
 */
#include <ncurses.h>

class Terminal {
public:
  Terminal();
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
};
