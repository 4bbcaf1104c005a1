#include "renderer.hpp"
#include "scheduler.hpp"
#include "split_view.hpp"
#include "term_widgets.hpp"
#include <cassert>
#include <chrono>
#include <cmath>
#include <vector>

using namespace std::chrono_literals;

static bool near(double a, double b) { return std::fabs(a - b) < 1e-9; }

static void test_ratio_clamping() {
  TermWidgetFactory f;
  ManualClock clock;
  MainLoop loop(clock);
  SplitView low(f, loop, Orientation::Horizontal, f.new_label("a"), f.new_label("b"), -0.5);
  assert(low.ratio() == 0.0);
  low.set_ratio(1.5);
  assert(low.ratio() == 1.0);
  low.set_ratio(0.3);
  assert(near(low.ratio(), 0.3));
}

static void test_apply_on_map() {
  TermWidgetFactory f;
  ManualClock clock;
  MainLoop loop(clock);
  auto start = f.new_label("start");
  SplitView split(f, loop, Orientation::Horizontal, start, f.new_label("end"), 0.3);
  assert(split.state() == SplitView::RatioState::PendingAllocation);
  assert(split.has_retry_subscriptions());
  assert(f.clock().size() == 1);

  Renderer::layout_frame(split.widget(), Rect{0, 0, 10, 40});
  assert(split.state() == SplitView::RatioState::Applied);
  assert(split.paned()->position() == 12);
  assert(start->allocated_width() == 12);
  assert(!split.has_retry_subscriptions());
  assert(f.clock().size() == 0);

  // applied directly once allocated
  split.set_ratio(0.75);
  assert(split.paned()->position() == 30);
  assert(split.state() == SplitView::RatioState::Applied);
}

static void test_apply_on_tick() {
  TermWidgetFactory f;
  ManualClock clock;
  MainLoop loop(clock);
  SplitView split(f, loop, Orientation::Vertical, f.new_label("a"), f.new_label("b"), 0.25);
  f.clock().tick();
  assert(split.state() == SplitView::RatioState::PendingAllocation);
  assert(split.has_retry_subscriptions());

  // allocated without a map notification
  term_node(split.widget().get())->layout(Rect{0, 0, 20, 10});
  f.clock().tick();
  assert(split.state() == SplitView::RatioState::Applied);
  assert(split.paned()->position() == 5);
  assert(!split.has_retry_subscriptions());
  assert(f.clock().size() == 0);
}

static void test_tick_retries_are_bounded() {
  TermWidgetFactory f;
  ManualClock clock;
  MainLoop loop(clock);
  SplitOptions opts;
  opts.max_retry_frames = 3;
  SplitView split(f, loop, Orientation::Horizontal, f.new_label("a"), f.new_label("b"), 0.5, opts);
  for (int i = 0; i < 10; ++i) f.clock().tick();
  assert(f.clock().size() == 0);
  assert(split.state() == SplitView::RatioState::PendingAllocation);
  // the map subscription stays armed
  assert(split.has_retry_subscriptions());
  Renderer::layout_frame(split.widget(), Rect{0, 0, 5, 20});
  assert(split.state() == SplitView::RatioState::Applied);
  assert(split.paned()->position() == 10);
}

static void test_drag_notifies_debounced() {
  TermWidgetFactory f;
  ManualClock clock;
  MainLoop loop(clock);
  SplitView split(f, loop, Orientation::Horizontal, f.new_label("a"), f.new_label("b"), 0.5);
  std::vector<double> seen;
  split.set_on_ratio_changed([&](double r){ seen.push_back(r); });
  Renderer::layout_frame(split.widget(), Rect{0, 0, 10, 40});
  assert(split.paned()->position() == 20);

  // programmatic positioning never notifies
  split.set_ratio(0.5);
  clock.advance(200ms);
  loop.run_pending();
  assert(seen.empty());

  auto* paned = static_cast<TermPaned*>(split.paned().get());
  paned->drag(4);
  assert(near(split.ratio(), 0.6));
  clock.advance(50ms);
  paned->drag(4);
  assert(near(split.ratio(), 0.7));
  clock.advance(50ms);
  loop.run_pending();
  assert(seen.empty());
  clock.advance(50ms);
  loop.run_pending();
  assert(seen.size() == 1);
  assert(near(seen[0], 0.7));
}

static void test_destroy_cancels_pending_work() {
  TermWidgetFactory f;
  ManualClock clock;
  MainLoop loop(clock);
  bool fired = false;
  {
    SplitView split(f, loop, Orientation::Horizontal, f.new_label("a"), f.new_label("b"), 0.5);
    split.set_on_ratio_changed([&](double){ fired = true; });
    Renderer::layout_frame(split.widget(), Rect{0, 0, 10, 40});
    static_cast<TermPaned*>(split.paned().get())->drag(1);
    assert(loop.timer_count() == 1);
  }
  assert(loop.timer_count() == 0);
  clock.advance(1s);
  loop.run_pending();
  assert(!fired);

  {
    SplitView pending(f, loop, Orientation::Horizontal, f.new_label("a"), f.new_label("b"), 0.5);
    assert(f.clock().size() == 1);
  }
  assert(f.clock().size() == 0);
}

static void test_swap_children() {
  TermWidgetFactory f;
  ManualClock clock;
  MainLoop loop(clock);
  auto a = f.new_label("a");
  auto b = f.new_label("b");
  auto c = f.new_label("c");
  SplitView split(f, loop, Orientation::Horizontal, a, b, 0.5);
  split.swap_start(c);
  assert(split.start_child() == c);
  assert(a->parent() == nullptr);
  split.swap_end(a);
  assert(split.end_child() == a);
  assert(b->parent() == nullptr);
  assert(a->parent() == split.widget().get());
}

int main() {
  test_ratio_clamping();
  test_apply_on_map();
  test_apply_on_tick();
  test_tick_retries_are_bounded();
  test_drag_notifies_debounced();
  test_destroy_cancels_pending_work();
  test_swap_children();
  return 0;
}
