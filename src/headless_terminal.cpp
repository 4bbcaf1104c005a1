#include "headless_terminal.hpp"
#include <algorithm>

HeadlessTerminal::HeadlessTerminal(int rows, int cols) : rows_(0), cols_(0) { resize(rows, cols); }

void HeadlessTerminal::resize(int rows, int cols) {
  rows_ = std::max(0, rows);
  cols_ = std::max(0, cols);
  clear();
}

void HeadlessTerminal::clear() {
  grid_.assign(rows_, std::string(cols_, ' '));
  hl_.assign(rows_, std::vector<unsigned char>(cols_, 0));
  color_.assign(rows_, std::vector<int>(cols_, kPairDefault));
}

void HeadlessTerminal::put(int row, int col, const std::string& text, bool hl, int color) {
  if (row < 0 || row >= rows_) return;
  for (size_t i = 0; i < text.size(); ++i) {
    int c = col + static_cast<int>(i);
    if (c < 0) continue;
    if (c >= cols_) break;
    grid_[row][c] = text[i];
    hl_[row][c] = hl ? 1 : 0;
    color_[row][c] = color;
  }
}

void HeadlessTerminal::draw_text(int row, int col, const std::string& text) {
  put(row, col, text, false, kPairDefault);
}

void HeadlessTerminal::draw_highlighted(int row, int col, const std::string& text, int hl_start, int hl_len) {
  int len = static_cast<int>(text.size());
  hl_start = std::clamp(hl_start, 0, len);
  int hl_end = std::clamp(hl_start + std::max(0, hl_len), hl_start, len);
  put(row, col, text.substr(0, hl_start), false, kPairDefault);
  put(row, col + hl_start, text.substr(hl_start, hl_end - hl_start), true, kPairDefault);
  put(row, col + hl_end, text.substr(hl_end), false, kPairDefault);
}

void HeadlessTerminal::draw_colored(int row, int col, const std::string& text, int color_pair_id) {
  put(row, col, text, false, color_pair_id);
}

void HeadlessTerminal::clear_to_eol(int row, int col) {
  if (row < 0 || row >= rows_) return;
  int c0 = std::max(0, col);
  if (c0 >= cols_) return;
  put(row, c0, std::string(cols_ - c0, ' '), false, kPairDefault);
}

std::string HeadlessTerminal::row_text(int row) const {
  if (row < 0 || row >= rows_) return std::string();
  return grid_[row];
}

char HeadlessTerminal::at(int row, int col) const {
  return in_bounds(row, col) ? grid_[row][col] : '\0';
}

bool HeadlessTerminal::highlighted(int row, int col) const {
  return in_bounds(row, col) && hl_[row][col] != 0;
}

int HeadlessTerminal::color(int row, int col) const {
  return in_bounds(row, col) ? color_[row][col] : kPairDefault;
}

bool HeadlessTerminal::contains(const std::string& text) const {
  return find(text).first >= 0;
}

std::pair<int, int> HeadlessTerminal::find(const std::string& text) const {
  for (int r = 0; r < rows_; ++r) {
    auto pos = grid_[r].find(text);
    if (pos != std::string::npos) return {r, static_cast<int>(pos)};
  }
  return {-1, -1};
}
