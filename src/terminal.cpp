#include "terminal.hpp"
#include <cstdio>
#include <locale.h>

Terminal::Terminal(int frame_ms) {
  setlocale(LC_ALL, "");
  initscr();
  raw();
  noecho();
  keypad(stdscr, TRUE);
  ESCDELAY = 25;
  set_frame_timeout(frame_ms);
}

Terminal::~Terminal() {
  // leave the outer terminal without motion reporting
  std::printf("\033[?1003l");
  std::fflush(stdout);
  endwin();
}

void Terminal::set_frame_timeout(int frame_ms) {
  timeout(frame_ms > 0 ? frame_ms : 16);
}
