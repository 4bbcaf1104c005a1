#include "ncurses_terminal.hpp"
#include <algorithm>
#include <cstdio>

NcursesTerminal::NcursesTerminal() {
  if (has_colors()) {
    start_color();
    if (use_default_colors() != OK) bg_color_ = COLOR_BLACK;
    init_pairs();
  }
}

NcursesTerminal::~NcursesTerminal() {
  if (mouse_) set_mouse(false);
}

void NcursesTerminal::init_pairs() {
  init_pair(kPairAccent, COLOR_YELLOW, bg_color_);
  init_pair(kPairDefault, -1, bg_color_);
  init_pair(kPairBorder, COLOR_CYAN, bg_color_);
}

TermSize NcursesTerminal::get_size() const {
  int r, c; getmaxyx(stdscr, r, c); return {r, c};
}

void NcursesTerminal::clear() { erase(); }

void NcursesTerminal::draw_text(int row, int col, const std::string& text) {
  if (has_colors()) attron(COLOR_PAIR(kPairDefault));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(kPairDefault));
}

void NcursesTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = (int)text.size();
  if (hl_start < 0) hl_start = 0;
  if (hl_len < 0) hl_len = 0;
  hl_start = std::min(hl_start, len);
  int hl_end = std::min(len, hl_start + hl_len);
  if (hl_start > 0) {
    std::string left = text.substr(0, hl_start);
    mvaddnstr(row, col, left.c_str(), (int)left.size());
    col += (int)left.size();
  }
  if (hl_end > hl_start) {
    std::string mid = text.substr(hl_start, hl_end - hl_start);
    attron(A_REVERSE);
    mvaddnstr(row, col, mid.c_str(), (int)mid.size());
    attroff(A_REVERSE);
    col += (int)mid.size();
  }
  if (hl_end < len) {
    std::string right = text.substr(hl_end);
    mvaddnstr(row, col, right.c_str(), (int)right.size());
  }
}

void NcursesTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  if (has_colors()) attron(COLOR_PAIR(color_pair_id));
  mvaddnstr(row, col, text.c_str(), (int)text.size());
  if (has_colors()) attroff(COLOR_PAIR(color_pair_id));
}

void NcursesTerminal::move_cursor(int row, int col) { move(row, col); }

void NcursesTerminal::refresh() { ::refresh(); }

void NcursesTerminal::set_background(short color) {
  if (!has_colors()) return;
  bg_color_ = color;
  init_pairs();
  wbkgd(stdscr, COLOR_PAIR(kPairDefault));
  erase();
}

void NcursesTerminal::set_mouse(bool enabled) {
  mouse_ = enabled;
  if (enabled) {
    mousemask(ALL_MOUSE_EVENTS | REPORT_MOUSE_POSITION, nullptr);
    mouseinterval(0);
    // ncurses only asks for click tracking; motion needs mode 1003
    std::printf("\033[?1003h");
  } else {
    mousemask(0, nullptr);
    std::printf("\033[?1003l");
  }
  std::fflush(stdout);
}

void NcursesTerminal::clear_to_eol(int row, int col) {
  move(row, col);
  clrtoeol();
}
