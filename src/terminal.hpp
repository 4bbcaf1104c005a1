#pragma once
/*
 * Terminal
 *
 * Purpose: RAII wrapper around ncurses init/teardown.
 * Usage: construct in main; destructor restores terminal.
 * Note: manages terminal modes (raw/noecho/keypad, frame-length getch
 * timeout), not rendering.
 */
#include <ncurses.h>

class Terminal {
public:
  explicit Terminal(int frame_ms);
  ~Terminal();
  Terminal(const Terminal&) = delete;
  Terminal& operator=(const Terminal&) = delete;
  // getch() returns ERR after this many ms so timers and ticks keep running
  void set_frame_timeout(int frame_ms);
};
