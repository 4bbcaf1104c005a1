#pragma once
/*
 * FindBar
 *
 * Purpose: find-in-page popup with a query line and a "current/total" counter.
 * Bound to the FindController of the pane it is anchored to; query edits are
 * debounced, next/previous with no matches re-run the search, hide finishes
 * the search and unbinds.
 */
#include "scheduler.hpp"
#include "widget.hpp"
#include <functional>
#include <memory>
#include <string>

class FindController {
public:
  using ResultFn = std::function<void(int current, int total)>;
  virtual ~FindController() = default;
  virtual void search(const std::string& text) = 0;
  virtual void search_next() = 0;
  virtual void search_previous() = 0;
  virtual void finish() = 0;
  // current is 1-based; (0, 0) when nothing matched
  virtual void set_result_callback(ResultFn fn) = 0;
};

class FindBar {
public:
  FindBar(WidgetFactory& factory, Scheduler& sched, std::chrono::milliseconds debounce);
  ~FindBar();
  FindBar(const FindBar&) = delete;
  FindBar& operator=(const FindBar&) = delete;

  WidgetPtr widget() const { return root_; }

  void bind(FindController* controller);
  void unbind();
  FindController* controller() const { return controller_; }

  void show();
  void hide();
  bool is_visible() const { return visible_; }

  void set_query(const std::string& query);
  const std::string& query() const { return query_; }
  void append_char(char c);
  void backspace();

  void next();
  void previous();
  int current() const { return current_; }
  int total() const { return total_; }
  std::string counter_text() const;

private:
  void schedule_search();
  void run_search();
  void on_result(int current, int total);
  void refresh();

  std::shared_ptr<BoxWidget> root_;
  std::shared_ptr<LabelWidget> entry_;
  std::shared_ptr<LabelWidget> counter_;
  DebounceTimer debounce_;
  FindController* controller_ = nullptr;
  std::string query_;
  std::string searched_;
  int current_ = 0;
  int total_ = 0;
  bool visible_ = false;
};
