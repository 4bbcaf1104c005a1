#include "scheduler.hpp"
#include <algorithm>
#include <vector>

MainLoop::MainLoop() : now_fn_([]{ return Clock::now(); }) {}

MainLoop::MainLoop(NowFn now_fn) : now_fn_(std::move(now_fn)) {}

MainLoop::MainLoop(ManualClock& clock) : now_fn_([&clock]{ return clock.now(); }) {}

void MainLoop::post(Task task) {
  std::lock_guard<std::mutex> lk(mu_);
  posted_.push_back(std::move(task));
}

TimerId MainLoop::add_timeout(std::chrono::milliseconds delay, Task task) {
  auto due = now() + delay;
  std::lock_guard<std::mutex> lk(mu_);
  TimerId id = next_id_++;
  timers_.emplace(id, Timer{due, std::move(task)});
  return id;
}

bool MainLoop::cancel(TimerId id) {
  std::lock_guard<std::mutex> lk(mu_);
  return timers_.erase(id) > 0;
}

MainLoop::Clock::time_point MainLoop::now() const { return now_fn_(); }

size_t MainLoop::run_pending() {
  size_t ran = 0;
  std::deque<Task> batch;
  {
    std::lock_guard<std::mutex> lk(mu_);
    batch.swap(posted_);
  }
  for (auto& t : batch) { if (t) t(); ran++; }

  auto t_now = now();
  std::vector<std::pair<Clock::time_point, TimerId>> due;
  {
    std::lock_guard<std::mutex> lk(mu_);
    for (const auto& [id, timer] : timers_) {
      if (timer.due <= t_now) due.emplace_back(timer.due, id);
    }
  }
  std::sort(due.begin(), due.end());
  for (const auto& d : due) {
    Task task;
    {
      // a timer run earlier in this batch may have cancelled this one
      std::lock_guard<std::mutex> lk(mu_);
      auto it = timers_.find(d.second);
      if (it == timers_.end()) continue;
      task = std::move(it->second.task);
      timers_.erase(it);
    }
    if (task) task();
    ran++;
  }
  return ran;
}

int MainLoop::next_timeout_ms() const {
  auto t_now = now();
  std::lock_guard<std::mutex> lk(mu_);
  if (timers_.empty()) return -1;
  auto best = Clock::time_point::max();
  for (const auto& [id, timer] : timers_) best = std::min(best, timer.due);
  if (best <= t_now) return 0;
  return static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(best - t_now).count());
}

bool MainLoop::has_pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return !posted_.empty() || !timers_.empty();
}

size_t MainLoop::timer_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return timers_.size();
}

DebounceTimer::DebounceTimer(Scheduler& sched, std::chrono::milliseconds delay)
  : sched_(sched), delay_(delay) {}

DebounceTimer::~DebounceTimer() { cancel(); }

void DebounceTimer::schedule(Scheduler::Task task) {
  cancel();
  std::uint64_t gen = ++generation_;
  id_ = sched_.add_timeout(delay_, [this, gen, task = std::move(task)]{
    if (generation_ == gen) id_ = 0;
    task();
  });
}

void DebounceTimer::cancel() {
  if (id_ != 0) {
    sched_.cancel(id_);
    id_ = 0;
  }
  ++generation_;
}

BackgroundWorker::BackgroundWorker() : thread_([this]{ run(); }) {}

BackgroundWorker::~BackgroundWorker() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    stop_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void BackgroundWorker::submit(std::function<void()> job) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    jobs_.push_back(std::move(job));
  }
  cv_.notify_one();
}

void BackgroundWorker::wait_idle() {
  std::unique_lock<std::mutex> lk(mu_);
  idle_cv_.wait(lk, [this]{ return jobs_.empty() && !busy_; });
}

void BackgroundWorker::run() {
  for (;;) {
    std::function<void()> job;
    {
      std::unique_lock<std::mutex> lk(mu_);
      cv_.wait(lk, [this]{ return stop_ || !jobs_.empty(); });
      if (stop_ && jobs_.empty()) return;
      job = std::move(jobs_.front());
      jobs_.pop_front();
      busy_ = true;
    }
    if (job) job();
    {
      std::lock_guard<std::mutex> lk(mu_);
      busy_ = false;
    }
    idle_cv_.notify_all();
  }
}
