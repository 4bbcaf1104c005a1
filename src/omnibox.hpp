#pragma once
/*
 * Omnibox
 *
 * Purpose: address/search popup anchored to a pane.
 * Search: typing arms one debounced search; the query runs on the background
 * worker against the SuggestionSource and the result is posted back to the UI
 * loop. Results are applied only if the version token captured at search
 * start is still current (show/hide/query edits bump it).
 * Ownership: held by shared_ptr; deferred work keeps only a weak_ptr.
 */
#include "scheduler.hpp"
#include "widget.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

struct Suggestion {
  std::string title;
  std::string uri;
  int score = 0;
};

// Called on the background worker thread.
class SuggestionSource {
public:
  virtual ~SuggestionSource() = default;
  virtual std::vector<Suggestion> query(const std::string& text, size_t max_results) = 0;
};

struct OmniboxOptions {
  std::chrono::milliseconds debounce{150};
  size_t max_results = 10;
  int width = 60;
};

bool looks_like_location(const std::string& text);

class Omnibox : public std::enable_shared_from_this<Omnibox> {
public:
  using NavigateFn = std::function<void(const std::string& target)>;

  Omnibox(WidgetFactory& factory, Scheduler& sched, BackgroundWorker& worker,
          std::shared_ptr<SuggestionSource> source, OmniboxOptions opts = {});
  ~Omnibox();

  WidgetPtr widget() const { return root_; }

  void show(const std::string& query);
  void hide();
  void toggle();
  bool is_visible() const { return visible_; }

  void set_query(const std::string& query);
  const std::string& query() const { return query_; }
  void append_char(char c);
  void backspace();

  void select_next();
  void select_previous();
  int selected_index() const { return selected_; }
  const std::vector<Suggestion>& results() const { return results_; }
  bool is_searching() const { return searching_; }
  StateVersion::Token version() const { return version_.current(); }

  // Navigates to the selection (or the typed text); hides on success.
  bool activate();
  void set_on_navigate(NavigateFn fn) { on_navigate_ = std::move(fn); }

private:
  void query_changed();
  void start_search();
  void apply_results(StateVersion::Token token, const std::string& query, std::vector<Suggestion> results);
  void rebuild_list();
  void refresh_entry();

  WidgetFactory& factory_;
  Scheduler& sched_;
  BackgroundWorker& worker_;
  std::shared_ptr<SuggestionSource> source_;
  OmniboxOptions opts_;

  std::shared_ptr<BoxWidget> root_;
  std::shared_ptr<BoxWidget> entry_row_;
  std::shared_ptr<LabelWidget> entry_;
  std::shared_ptr<SpinnerWidget> spinner_;
  std::shared_ptr<BoxWidget> list_;

  DebounceTimer debounce_;
  StateVersion version_;
  std::string query_;
  std::string last_searched_;
  std::vector<Suggestion> results_;
  int selected_ = -1;
  bool visible_ = false;
  bool searching_ = false;
  NavigateFn on_navigate_;
};
