#include "split_view.hpp"
#include <algorithm>
#include <cmath>
#include <mutex>

SplitView::SplitView(WidgetFactory& factory, Scheduler& sched, Orientation orientation,
                     WidgetPtr start, WidgetPtr end, double ratio, SplitOptions opts)
  : orientation_(orientation), opts_(opts), paned_(factory.new_paned(orientation)),
    notify_(sched, opts.notify_delay), ratio_(std::clamp(ratio, 0.0, 1.0)) {
  paned_->set_hexpand(true);
  paned_->set_vexpand(true);
  paned_->set_resize_start_child(true);
  paned_->set_resize_end_child(true);
  paned_->set_wide_handle(true);
  paned_->set_start_child(std::move(start));
  paned_->set_end_child(std::move(end));
  position_id_ = paned_->connect_notify_position([this]{ on_position_changed(); });
  apply_ratio();
}

SplitView::~SplitView() {
  notify_.cancel();
  drop_retry();
  if (position_id_) paned_->disconnect(position_id_);
}

WidgetPtr SplitView::start_child() const { return paned_->start_child(); }
WidgetPtr SplitView::end_child() const { return paned_->end_child(); }

void SplitView::set_ratio(double ratio) {
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    ratio_ = std::clamp(ratio, 0.0, 1.0);
  }
  apply_ratio();
}

double SplitView::ratio() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return ratio_;
}

SplitView::RatioState SplitView::state() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return state_;
}

bool SplitView::has_retry_subscriptions() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return map_id_ != 0 || tick_id_ != 0;
}

int SplitView::axis_size() const {
  return orientation_ == Orientation::Horizontal ? paned_->allocated_width() : paned_->allocated_height();
}

bool SplitView::apply_ratio() {
  int size = axis_size();
  if (size <= 0) {
    {
      std::unique_lock<std::shared_mutex> lk(mu_);
      state_ = RatioState::PendingAllocation;
    }
    subscribe_retry();
    return false;
  }
  double r;
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    r = ratio_;
    state_ = RatioState::Applied;
  }
  paned_->set_position(static_cast<int>(std::lround(size * r)));
  drop_retry();
  return true;
}

void SplitView::subscribe_retry() {
  std::unique_lock<std::shared_mutex> lk(mu_);
  if (map_id_ == 0) {
    map_id_ = paned_->connect_map([this]{ apply_ratio(); });
  }
  if (tick_id_ == 0) {
    tick_frames_ = 0;
    tick_id_ = paned_->add_tick_callback([this]{ return on_tick(); });
  }
}

void SplitView::drop_retry() {
  SignalId map_id, tick_id;
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    map_id = map_id_;
    tick_id = tick_id_;
    map_id_ = 0;
    tick_id_ = 0;
  }
  if (map_id) paned_->disconnect(map_id);
  if (tick_id) paned_->remove_tick_callback(tick_id);
}

bool SplitView::on_tick() {
  if (apply_ratio()) return false;
  std::unique_lock<std::shared_mutex> lk(mu_);
  if (++tick_frames_ < opts_.max_retry_frames) return true;
  // gives up on ticks; a later map still retries
  tick_id_ = 0;
  return false;
}

void SplitView::swap_start(WidgetPtr w) {
  paned_->set_start_child(nullptr);
  paned_->set_start_child(std::move(w));
}

void SplitView::swap_end(WidgetPtr w) {
  paned_->set_end_child(nullptr);
  paned_->set_end_child(std::move(w));
}

void SplitView::set_on_ratio_changed(RatioChangedFn fn) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  on_ratio_changed_ = std::move(fn);
}

void SplitView::on_position_changed() {
  int size = axis_size();
  if (size <= 0) return;
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    ratio_ = std::clamp(static_cast<double>(paned_->position()) / size, 0.0, 1.0);
    state_ = RatioState::Applied;
  }
  notify_.schedule([this]{
    RatioChangedFn fn;
    double r;
    {
      std::shared_lock<std::shared_mutex> lk(mu_);
      fn = on_ratio_changed_;
      r = ratio_;
    }
    if (fn) fn(r);
  });
}
