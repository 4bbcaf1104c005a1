#pragma once
/*
 * SplitView
 *
 * Purpose: two-child divider container over a PanedWidget.
 * Ratio: the target ratio is kept in [0,1] and applied as
 * position = round(size * ratio) once the paned has a size along its axis.
 * Until then the view stays PendingAllocation and retries on map and on
 * every frame tick (bounded), unsubscribing as soon as it succeeds.
 * Drag: user divider moves recompute the ratio and notify, debounced.
 */
#include "scheduler.hpp"
#include "widget.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <shared_mutex>

struct SplitOptions {
  std::chrono::milliseconds notify_delay{100};
  int max_retry_frames = 120;
};

class SplitView {
public:
  enum class RatioState { PendingAllocation, Applied };
  using RatioChangedFn = std::function<void(double)>;

  SplitView(WidgetFactory& factory, Scheduler& sched, Orientation orientation,
            WidgetPtr start, WidgetPtr end, double ratio, SplitOptions opts = {});
  ~SplitView();
  SplitView(const SplitView&) = delete;
  SplitView& operator=(const SplitView&) = delete;

  WidgetPtr widget() const { return paned_; }
  std::shared_ptr<PanedWidget> paned() const { return paned_; }
  Orientation orientation() const { return orientation_; }
  WidgetPtr start_child() const;
  WidgetPtr end_child() const;

  void set_ratio(double ratio);
  double ratio() const;
  RatioState state() const;
  bool has_retry_subscriptions() const;

  // Returns true when the divider was positioned.
  bool apply_ratio();

  void swap_start(WidgetPtr w);
  void swap_end(WidgetPtr w);

  void set_on_ratio_changed(RatioChangedFn fn);

private:
  int axis_size() const;
  void subscribe_retry();
  void drop_retry();
  void on_position_changed();
  bool on_tick();

  Orientation orientation_;
  SplitOptions opts_;
  std::shared_ptr<PanedWidget> paned_;
  DebounceTimer notify_;

  mutable std::shared_mutex mu_;
  double ratio_ = 0.5;
  RatioState state_ = RatioState::PendingAllocation;
  SignalId map_id_ = 0;
  SignalId tick_id_ = 0;
  SignalId position_id_ = 0;
  int tick_frames_ = 0;
  RatioChangedFn on_ratio_changed_;
};
