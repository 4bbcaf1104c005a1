#pragma once
/*
 * HoverHandler
 *
 * Purpose: debounced focus-follows-mouse for one pane.
 * Enter arms a single timer, leave cancels it; when the timer fires the
 * hover callback runs on the UI loop.
 */
#include "scheduler.hpp"
#include "widget.hpp"
#include <functional>
#include <memory>

class HoverHandler {
public:
  HoverHandler(Scheduler& sched, std::chrono::milliseconds delay);
  ~HoverHandler();
  HoverHandler(const HoverHandler&) = delete;
  HoverHandler& operator=(const HoverHandler&) = delete;

  void attach(const WidgetPtr& target, std::function<void()> on_hover);
  void detach();
  void cancel() { timer_.cancel(); }
  bool pending() const { return timer_.pending(); }
  bool attached() const { return !target_.expired(); }

  void on_enter();
  void on_leave();

private:
  DebounceTimer timer_;
  std::weak_ptr<Widget> target_;
  SignalId enter_id_ = 0;
  SignalId leave_id_ = 0;
  std::function<void()> on_hover_;
};
