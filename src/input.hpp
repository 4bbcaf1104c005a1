#pragma once
#include <cstddef>
/*
 * Input
 *
 * Purpose: parse tile-mode key sequences (Ctrl-W window prefix, count
 * prefixes) with minimal state.
 * Extend: maps keys to WindowCmd; decoupled from the concrete layout actions.
 */

enum class WindowCmd {
  None,
  FocusLeft, FocusDown, FocusUp, FocusRight, FocusNext,
  SplitVertical, SplitHorizontal, Stack,
  Close, StackNext, StackPrevious,
  ShrinkWidth, GrowWidth, ShrinkHeight, GrowHeight,
  MoveLeft, MoveDown, MoveUp, MoveRight
};

class Input {
public:
  // Ctrl-W starts a window command; the next key selects it
  bool consume_window(int ch, WindowCmd& cmd);
  bool window_pending() const { return pending_w_; }
  bool consume_digit(int ch);
  bool has_count() const;
  size_t take_count();
  void reset();
  static WindowCmd window_cmd_for(int ch);
private:
  bool pending_w_ = false;
  size_t pending_count_ = 0;
};

// Ctrl-W as delivered by getch()
constexpr int kCtrlW = 23;
