#include "hover_handler.hpp"

HoverHandler::HoverHandler(Scheduler& sched, std::chrono::milliseconds delay)
  : timer_(sched, delay) {}

HoverHandler::~HoverHandler() { detach(); }

void HoverHandler::attach(const WidgetPtr& target, std::function<void()> on_hover) {
  detach();
  if (!target) return;
  target_ = target;
  on_hover_ = std::move(on_hover);
  enter_id_ = target->connect_enter([this]{ on_enter(); });
  leave_id_ = target->connect_leave([this]{ on_leave(); });
}

void HoverHandler::detach() {
  timer_.cancel();
  if (auto t = target_.lock()) {
    if (enter_id_) t->disconnect(enter_id_);
    if (leave_id_) t->disconnect(leave_id_);
  }
  enter_id_ = 0;
  leave_id_ = 0;
  target_.reset();
  on_hover_ = nullptr;
}

void HoverHandler::on_enter() {
  if (!on_hover_) return;
  timer_.schedule([this]{ if (on_hover_) on_hover_(); });
}

void HoverHandler::on_leave() { timer_.cancel(); }
