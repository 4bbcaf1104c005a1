#pragma once
/*
 * HeadlessTerminal
 *
 * Purpose: in-memory ITerminal used by the tests and by render checks.
 * Records a character grid plus per-cell highlight/color so assertions can
 * look at what a frame would have shown.
 */
#include "iterminal.hpp"
#include <string>
#include <utility>
#include <vector>

class HeadlessTerminal : public ITerminal {
public:
  HeadlessTerminal(int rows, int cols);
  TermSize get_size() const override { return {rows_, cols_}; }
  void clear() override;
  void draw_text(int row, int col, const std::string& text) override;
  void draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) override;
  void draw_colored(int row, int col, const std::string& text, int color_pair_id) override;
  void move_cursor(int row, int col) override { cursor_row_ = row; cursor_col_ = col; }
  void refresh() override { refreshes_++; }
  void clear_to_eol(int row, int col) override;

  void resize(int rows, int cols);
  std::string row_text(int row) const;
  char at(int row, int col) const;
  bool highlighted(int row, int col) const;
  int color(int row, int col) const;
  bool contains(const std::string& text) const;
  // first (row, col) of text, or (-1, -1)
  std::pair<int, int> find(const std::string& text) const;
  int cursor_row() const { return cursor_row_; }
  int cursor_col() const { return cursor_col_; }
  int refresh_count() const { return refreshes_; }

private:
  void put(int row, int col, const std::string& text, bool hl, int color);
  bool in_bounds(int row, int col) const { return row >= 0 && row < rows_ && col >= 0 && col < cols_; }

  int rows_;
  int cols_;
  std::vector<std::string> grid_;
  std::vector<std::vector<unsigned char>> hl_;
  std::vector<std::vector<int>> color_;
  int cursor_row_ = 0;
  int cursor_col_ = 0;
  int refreshes_ = 0;
};
