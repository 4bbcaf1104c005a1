#pragma once
/*
 * TreeRenderer
 *
 * Purpose: build a widget tree from a PaneNode tree and keep an ID → widget
 * registry of every node with a non-empty id.
 * Build: the previous registry is dropped first; the new one is collected
 * aside and committed only when the whole build succeeded.
 * Leaves: widgets come from the PaneViewFactory; a null widget omits the leaf.
 */
#include "layout_error.hpp"
#include "pane_tree.hpp"
#include "scheduler.hpp"
#include "split_view.hpp"
#include "stacked_view.hpp"
#include "widget.hpp"
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

class PaneViewFactory {
public:
  virtual ~PaneViewFactory() = default;
  virtual WidgetPtr create_pane_widget(const PaneNode& leaf) = 0;
};

class TreeRenderer {
public:
  using SplitRatioFn = std::function<void(const std::string& node_id, double ratio)>;
  using PaneEventFn = std::function<void(const std::string& pane_id)>;

  TreeRenderer(WidgetFactory& factory, Scheduler& sched, PaneViewFactory* pane_factory,
               SplitOptions opts = {});

  LayoutError build(const PaneNode* root, WidgetPtr& out);
  void clear();

  int node_count() const;
  WidgetPtr lookup(const std::string& id) const;
  bool lookup_node(const std::string& id, WidgetPtr& out) const;
  std::vector<std::string> node_ids() const;

  void register_widget(const std::string& id, WidgetPtr w);
  void unregister_widget(const std::string& id);

  std::shared_ptr<SplitView> split_view(const std::string& node_id) const;
  std::shared_ptr<StackedView> stacked_view(const std::string& node_id) const;
  std::shared_ptr<StackedView> stacked_view_for_pane(const std::string& pane_id) const;
  LayoutError update_split_ratio(const std::string& node_id, double ratio);

  void set_pane_factory(PaneViewFactory* f) { pane_factory_ = f; }
  void set_split_options(SplitOptions opts) { opts_ = opts; }
  void set_on_split_ratio_changed(SplitRatioFn fn);
  void set_on_stack_activate(PaneEventFn fn);
  void set_on_stack_close(PaneEventFn fn);

private:
  struct Registry {
    std::unordered_map<std::string, WidgetPtr> widgets;
    std::unordered_map<std::string, std::shared_ptr<SplitView>> splits;
    std::unordered_map<std::string, std::shared_ptr<StackedView>> stacks;
    std::unordered_map<std::string, std::shared_ptr<StackedView>> pane_to_stack;
    // views of nodes without an id; owned here so their hooks stay connected
    std::vector<std::shared_ptr<SplitView>> anonymous_splits;
    std::vector<std::shared_ptr<StackedView>> anonymous_stacks;
  };

  LayoutError build_node(const PaneNode& node, Registry& reg, WidgetPtr& out);
  LayoutError build_split(const PaneNode& node, Registry& reg, WidgetPtr& out);
  LayoutError build_stack(const PaneNode& node, Registry& reg, WidgetPtr& out);
  void forward_ratio(const std::string& node_id, double ratio);
  void forward_stack_activate(const std::weak_ptr<StackedView>& stack, int index);
  void forward_stack_close(const std::string& pane_id);

  WidgetFactory& factory_;
  Scheduler& sched_;
  PaneViewFactory* pane_factory_;
  SplitOptions opts_;

  mutable std::shared_mutex mu_;
  Registry reg_;
  SplitRatioFn on_split_ratio_changed_;
  PaneEventFn on_stack_activate_;
  PaneEventFn on_stack_close_;
};
