#include "scheduler.hpp"
#include <atomic>
#include <cassert>
#include <chrono>
#include <string>
#include <vector>

using namespace std::chrono_literals;

static void test_post_and_timers() {
  ManualClock clock;
  MainLoop loop(clock);
  std::vector<std::string> order;
  loop.post([&]{ order.push_back("posted"); });
  TimerId late = loop.add_timeout(50ms, [&]{ order.push_back("late"); });
  loop.add_timeout(10ms, [&]{ order.push_back("early"); });
  assert(loop.has_pending());
  assert(loop.timer_count() == 2);
  assert(loop.next_timeout_ms() == 10);

  assert(loop.run_pending() == 1);
  assert(order.size() == 1);

  clock.advance(10ms);
  assert(loop.next_timeout_ms() == 40);
  loop.run_pending();
  assert(order.back() == "early");

  assert(loop.cancel(late));
  assert(!loop.cancel(late));
  clock.advance(100ms);
  assert(loop.run_pending() == 0);
  assert(order.size() == 2);
  assert(loop.next_timeout_ms() == -1);
  assert(!loop.has_pending());
}

static void test_timer_cancelled_by_earlier_timer() {
  ManualClock clock;
  MainLoop loop(clock);
  bool second_ran = false;
  TimerId second = 0;
  loop.add_timeout(5ms, [&]{ loop.cancel(second); });
  second = loop.add_timeout(6ms, [&]{ second_ran = true; });
  clock.advance(10ms);
  loop.run_pending();
  assert(!second_ran);
}

static void test_debounce() {
  ManualClock clock;
  MainLoop loop(clock);
  DebounceTimer timer(loop, 100ms);
  int fired = 0;
  timer.schedule([&]{ fired++; });
  clock.advance(60ms);
  timer.schedule([&]{ fired += 10; });
  assert(timer.pending());
  clock.advance(60ms);
  loop.run_pending();
  assert(fired == 0);
  clock.advance(40ms);
  loop.run_pending();
  assert(fired == 10);
  assert(!timer.pending());

  timer.schedule([&]{ fired++; });
  timer.cancel();
  clock.advance(200ms);
  loop.run_pending();
  assert(fired == 10);
  assert(loop.timer_count() == 0);

  timer.set_delay(5ms);
  assert(timer.delay() == 5ms);
}

static void test_state_version() {
  StateVersion v;
  auto t = v.current();
  assert(v.is_current(t));
  v.bump();
  assert(!v.is_current(t));
  assert(v.is_current(v.current()));
}

static void test_worker_posts_back() {
  ManualClock clock;
  MainLoop loop(clock);
  BackgroundWorker worker;
  std::atomic<int> computed{0};
  int delivered = 0;
  for (int i = 1; i <= 3; ++i) {
    worker.submit([&, i]{
      computed += i;
      loop.post([&, i]{ delivered += i; });
    });
  }
  worker.wait_idle();
  assert(computed == 6);
  assert(delivered == 0);
  loop.run_pending();
  assert(delivered == 6);
}

int main() {
  test_post_and_timers();
  test_timer_cancelled_by_earlier_timer();
  test_debounce();
  test_state_version();
  test_worker_posts_back();
  return 0;
}
