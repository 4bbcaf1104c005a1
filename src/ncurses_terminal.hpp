#pragma once
/*
 * NcursesTerminal
 *
 * Purpose: ITerminal implementation using ncurses for drawing, plus the
 * mouse-reporting switch used for hover focus.
 * Note: initialization/teardown is managed by Terminal RAII wrapper.
 */
#include "iterminal.hpp"
#include <ncurses.h>

class NcursesTerminal : public ITerminal {
public:
  NcursesTerminal();
  ~NcursesTerminal();
  TermSize get_size() const override;
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override;
  void refresh() override;
  void clear_to_eol(int row, int col) override;
  void set_background(short color);
  // button presses plus motion reports (xterm any-event tracking)
  void set_mouse(bool enabled);
  bool mouse_enabled() const { return mouse_; }
private:
  void init_pairs();
  short bg_color_ = -1; // -1: default background
  bool mouse_ = false;
};
