#include "input.hpp"

WindowCmd Input::window_cmd_for(int ch) {
  switch (ch) {
    case 'h': return WindowCmd::FocusLeft;
    case 'j': return WindowCmd::FocusDown;
    case 'k': return WindowCmd::FocusUp;
    case 'l': return WindowCmd::FocusRight;
    case 'w': case kCtrlW: return WindowCmd::FocusNext;
    case 'v': return WindowCmd::SplitVertical;
    case 's': return WindowCmd::SplitHorizontal;
    case 't': return WindowCmd::Stack;
    case 'c': case 'q': return WindowCmd::Close;
    case 'n': return WindowCmd::StackNext;
    case 'p': return WindowCmd::StackPrevious;
    case '<': return WindowCmd::ShrinkWidth;
    case '>': return WindowCmd::GrowWidth;
    case '-': return WindowCmd::ShrinkHeight;
    case '+': return WindowCmd::GrowHeight;
    case 'H': return WindowCmd::MoveLeft;
    case 'J': return WindowCmd::MoveDown;
    case 'K': return WindowCmd::MoveUp;
    case 'L': return WindowCmd::MoveRight;
    default: return WindowCmd::None;
  }
}

bool Input::consume_window(int ch, WindowCmd& cmd) {
  cmd = WindowCmd::None;
  if (!pending_w_) {
    if (ch == kCtrlW) { pending_w_ = true; return true; }
    return false;
  }
  // a count may sit between Ctrl-W and the command key
  if (consume_digit(ch)) return true;
  pending_w_ = false;
  cmd = window_cmd_for(ch);
  return true;
}

bool Input::consume_digit(int ch) {
  if (ch >= '1' && ch <= '9') {
    pending_count_ = pending_count_ * 10 + static_cast<size_t>(ch - '0');
    return true;
  }
  if (ch == '0') {
    if (pending_count_ > 0) {
      pending_count_ = pending_count_ * 10;
      return true;
    }
  }
  return false;
}

bool Input::has_count() const {
  return pending_count_ > 0;
}

size_t Input::take_count() {
  size_t c = pending_count_;
  pending_count_ = 0;
  return c;
}

void Input::reset() {
  pending_w_ = false;
  pending_count_ = 0;
}
