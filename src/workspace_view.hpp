#pragma once
/*
 * WorkspaceView
 *
 * Purpose: coordinator between the domain Workspace and the widget tree.
 * Owns: the TreeRenderer, the pane_id → PaneView registry, the pane-anchored
 * overlays (omnibox, find bar) and the hover-suppression window.
 * Rebuild: set_workspace()/rebuild() throw the old widget tree away and build
 * a new one; overlays and old pane views are torn down first.
 * Active pane: Workspace::active_pane_id is the only stored copy; overlays
 * anchored to the previous pane are torn down before its styling is cleared.
 * Locking: one shared_mutex; callbacks to the host run after it is released.
 */
#include "config.hpp"
#include "find_bar.hpp"
#include "layout_error.hpp"
#include "omnibox.hpp"
#include "pane_tree.hpp"
#include "pane_view.hpp"
#include "scheduler.hpp"
#include "status_log.hpp"
#include "tree_renderer.hpp"
#include "widget.hpp"
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

class ContentFactory {
public:
  virtual ~ContentFactory() = default;
  virtual WidgetPtr create_content(const Pane& pane) = 0;
};

using FindControllerProvider = std::function<FindController*(const std::string& pane_id)>;

class WorkspaceView : private PaneViewFactory {
public:
  using PaneFn = std::function<void(const std::string& pane_id)>;
  using RatioFn = std::function<void(const std::string& node_id, double ratio)>;
  using NavigateFn = std::function<void(const std::string& pane_id, const std::string& target)>;

  WorkspaceView(WidgetFactory& factory, Scheduler& sched, const Settings& settings);
  ~WorkspaceView() override;
  WorkspaceView(const WorkspaceView&) = delete;
  WorkspaceView& operator=(const WorkspaceView&) = delete;

  WidgetPtr widget() const { return container_; }
  TreeRenderer& renderer() { return renderer_; }
  const TreeRenderer& renderer() const { return renderer_; }

  void set_content_factory(ContentFactory* f) { content_factory_ = f; }
  void set_suggestion_source(std::shared_ptr<SuggestionSource> source, BackgroundWorker* worker);
  void set_find_controller_provider(FindControllerProvider provider);
  void set_status_log(StatusLog* log) { log_ = log; }

  LayoutError set_workspace(Workspace* ws);
  LayoutError rebuild();
  Workspace* workspace() const;

  LayoutError set_active_pane_id(const std::string& pane_id);
  std::string active_pane_id() const;
  bool focus_pane(const std::string& pane_id);

  std::shared_ptr<PaneView> pane_view(const std::string& pane_id) const;
  std::shared_ptr<PaneView> active_pane_view() const;
  std::vector<std::string> pane_ids() const;
  int pane_count() const;
  void register_pane_view(const std::string& pane_id, std::shared_ptr<PaneView> view);
  void unregister_pane_view(const std::string& pane_id);

  LayoutError set_content_widget(const std::string& pane_id, WidgetPtr w);
  WidgetPtr stack_container_widget(const std::string& pane_id) const;
  WidgetPtr pane_widget(const std::string& pane_id) const;

  bool show_omnibox(const std::string& query);
  void hide_omnibox();
  bool is_omnibox_visible() const;
  std::shared_ptr<Omnibox> omnibox() const;
  std::string omnibox_anchor() const;

  bool show_find_bar();
  void hide_find_bar();
  bool is_find_bar_visible() const;
  void find_next();
  void find_previous();
  FindBar* find_bar() const;
  std::string find_bar_anchor() const;

  void suppress_hover(std::chrono::milliseconds d);
  void suppress_hover_for_keyboard() { suppress_hover(settings_.keyboard_suppress()); }
  bool is_hover_suppressed() const;
  void cancel_all_pending_hovers();

  void set_on_pane_focused(PaneFn fn);
  void set_on_split_ratio_dragged(RatioFn fn);
  void set_on_close_pane(PaneFn fn);
  void set_on_navigate(NavigateFn fn);

private:
  WidgetPtr create_pane_widget(const PaneNode& leaf) override;

  void teardown_overlays_locked();
  void teardown_omnibox_locked();
  void teardown_find_bar_locked();
  void cleanup_pane_views_locked();
  void update_single_pane_class_locked();
  LayoutError activate_locked(const std::string& pane_id, bool force);

  void on_pane_hovered(const std::string& pane_id);
  void on_pane_pressed(const std::string& pane_id);
  void on_stack_activated(const std::string& pane_id);
  void on_stack_close(const std::string& pane_id);
  void on_omnibox_navigate(const std::string& target);
  void notify_focused(const std::string& pane_id);
  void report(LayoutError err, const std::string& what);

  WidgetFactory& factory_;
  Scheduler& sched_;
  const Settings& settings_;
  TreeRenderer renderer_;
  std::shared_ptr<BoxWidget> container_;
  std::shared_ptr<bool> alive_;

  ContentFactory* content_factory_ = nullptr;
  std::shared_ptr<SuggestionSource> suggestions_;
  BackgroundWorker* worker_ = nullptr;
  FindControllerProvider find_provider_;
  StatusLog* log_ = nullptr;

  mutable std::shared_mutex mu_;
  Workspace* workspace_ = nullptr;
  WidgetPtr root_widget_;
  std::unordered_map<std::string, std::shared_ptr<PaneView>> pane_views_;
  std::shared_ptr<Omnibox> omnibox_;
  std::string omnibox_anchor_;
  std::unique_ptr<FindBar> find_bar_;
  std::string find_bar_anchor_;
  Scheduler::Clock::time_point suppress_until_{};

  PaneFn on_pane_focused_;
  RatioFn on_split_ratio_dragged_;
  PaneFn on_close_pane_;
  NavigateFn on_navigate_;
};
