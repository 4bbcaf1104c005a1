#pragma once
/*
 * Scheduler
 *
 * Purpose: UI-loop task scheduling (post, timeouts) plus the small helpers
 * built on it: DebounceTimer, StateVersion and a BackgroundWorker thread.
 * Threading: MainLoop::post may be called from any thread; everything else
 * runs on the UI loop. Timers are only ever fired from run_pending().
 */
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <thread>

using TimerId = std::uint64_t;

class Scheduler {
public:
  using Task = std::function<void()>;
  using Clock = std::chrono::steady_clock;
  virtual ~Scheduler() = default;
  virtual void post(Task task) = 0;
  virtual TimerId add_timeout(std::chrono::milliseconds delay, Task task) = 0;
  virtual bool cancel(TimerId id) = 0;
  virtual Clock::time_point now() const = 0;
};

// Test clock: time only moves when advance() is called.
class ManualClock {
public:
  Scheduler::Clock::time_point now() const { return now_; }
  void advance(std::chrono::milliseconds d) { now_ += d; }
private:
  Scheduler::Clock::time_point now_{};
};

class MainLoop : public Scheduler {
public:
  using NowFn = std::function<Clock::time_point()>;
  MainLoop();
  explicit MainLoop(NowFn now_fn);
  explicit MainLoop(ManualClock& clock);

  void post(Task task) override;
  TimerId add_timeout(std::chrono::milliseconds delay, Task task) override;
  bool cancel(TimerId id) override;
  Clock::time_point now() const override;

  // Runs posted tasks, then every timer that is due. Returns tasks run.
  size_t run_pending();
  // Milliseconds until the next timer is due; -1 if none is armed.
  int next_timeout_ms() const;
  bool has_pending() const;
  size_t timer_count() const;

private:
  struct Timer {
    Clock::time_point due;
    Task task;
  };
  NowFn now_fn_;
  mutable std::mutex mu_;
  std::deque<Task> posted_;
  std::map<TimerId, Timer> timers_;
  TimerId next_id_ = 1;
};

// At most one pending timer; schedule() replaces the previous one.
class DebounceTimer {
public:
  DebounceTimer(Scheduler& sched, std::chrono::milliseconds delay);
  ~DebounceTimer();
  DebounceTimer(const DebounceTimer&) = delete;
  DebounceTimer& operator=(const DebounceTimer&) = delete;

  void schedule(Scheduler::Task task);
  void cancel();
  bool pending() const { return id_ != 0; }
  void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }
  std::chrono::milliseconds delay() const { return delay_; }

private:
  Scheduler& sched_;
  std::chrono::milliseconds delay_;
  TimerId id_ = 0;
  std::uint64_t generation_ = 0;
};

// Monotonic token; deferred work captures current() and checks is_current().
class StateVersion {
public:
  using Token = std::uint64_t;
  Token bump() { return ++value_; }
  Token current() const { return value_.load(); }
  bool is_current(Token t) const { return value_.load() == t; }
private:
  std::atomic<Token> value_{0};
};

class BackgroundWorker {
public:
  BackgroundWorker();
  ~BackgroundWorker();
  BackgroundWorker(const BackgroundWorker&) = delete;
  BackgroundWorker& operator=(const BackgroundWorker&) = delete;

  void submit(std::function<void()> job);
  // Blocks until the queue is drained and no job is running.
  void wait_idle();

private:
  void run();
  std::mutex mu_;
  std::condition_variable cv_;
  std::condition_variable idle_cv_;
  std::deque<std::function<void()>> jobs_;
  bool busy_ = false;
  bool stop_ = false;
  std::thread thread_;
};
