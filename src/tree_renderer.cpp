#include "tree_renderer.hpp"
#include <algorithm>
#include <mutex>

TreeRenderer::TreeRenderer(WidgetFactory& factory, Scheduler& sched, PaneViewFactory* pane_factory,
                           SplitOptions opts)
  : factory_(factory), sched_(sched), pane_factory_(pane_factory), opts_(opts) {}

LayoutError TreeRenderer::build(const PaneNode* root, WidgetPtr& out) {
  out = nullptr;
  clear();
  if (!root) return LayoutError::NilRoot;
  Registry fresh;
  WidgetPtr w;
  LayoutError err = build_node(*root, fresh, w);
  if (err != LayoutError::None) return err;
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    reg_ = std::move(fresh);
  }
  out = std::move(w);
  return LayoutError::None;
}

LayoutError TreeRenderer::build_node(const PaneNode& node, Registry& reg, WidgetPtr& out) {
  out = nullptr;
  if (node.is_leaf()) {
    if (!pane_factory_) return LayoutError::None;
    out = pane_factory_->create_pane_widget(node);
    if (out && !node.id.empty()) reg.widgets[node.id] = out;
    return LayoutError::None;
  }
  if (node.is_split()) return build_split(node, reg, out);
  if (node.is_stack()) return build_stack(node, reg, out);
  return LayoutError::InvalidNode;
}

LayoutError TreeRenderer::build_split(const PaneNode& node, Registry& reg, WidgetPtr& out) {
  WidgetPtr start, end;
  LayoutError err = build_node(*node.children[0], reg, start);
  if (err != LayoutError::None) return err;
  err = build_node(*node.children[1], reg, end);
  if (err != LayoutError::None) return err;
  // an omitted side leaves the other one in place of the split
  if (!start || !end) {
    out = start ? start : end;
    return LayoutError::None;
  }
  Orientation o = node.split_dir == SplitDir::Vertical ? Orientation::Vertical : Orientation::Horizontal;
  auto split = std::make_shared<SplitView>(factory_, sched_, o, std::move(start), std::move(end),
                                           node.split_ratio, opts_);
  std::string id = node.id;
  split->set_on_ratio_changed([this, id](double r){ forward_ratio(id, r); });
  out = split->widget();
  if (!id.empty()) {
    reg.widgets[id] = out;
    reg.splits[id] = split;
  } else {
    reg.anonymous_splits.push_back(split);
  }
  return LayoutError::None;
}

LayoutError TreeRenderer::build_stack(const PaneNode& node, Registry& reg, WidgetPtr& out) {
  auto stack = std::make_shared<StackedView>(factory_);
  std::vector<std::string> pane_ids;
  for (const auto& child : node.children) {
    WidgetPtr w;
    LayoutError err = build_node(*child, reg, w);
    if (err != LayoutError::None) return err;
    if (!w) continue;
    std::string pane_id = child->is_leaf() ? child->pane->id : child->id;
    std::string title = child->is_leaf() ? child->pane->title : child->id;
    stack->add_pane(pane_id, title, child->is_leaf() ? "text-x-generic" : "view-grid", std::move(w));
    if (child->is_leaf()) pane_ids.push_back(pane_id);
  }
  if (stack->count() == 0) return LayoutError::None;
  int active = std::clamp(node.active_stack_index, 0, stack->count() - 1);
  stack->set_active(active);

  std::weak_ptr<StackedView> weak = stack;
  stack->set_on_activate([this, weak](int index){ forward_stack_activate(weak, index); });
  stack->set_on_close_pane([this](const std::string& pane_id){ forward_stack_close(pane_id); });
  out = stack->widget();
  if (!node.id.empty()) {
    reg.widgets[node.id] = out;
    reg.stacks[node.id] = stack;
  } else {
    reg.anonymous_stacks.push_back(stack);
  }
  for (const auto& p : pane_ids) reg.pane_to_stack[p] = stack;
  return LayoutError::None;
}

void TreeRenderer::clear() {
  Registry old;
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    std::swap(old, reg_);
  }
  // views are released outside the lock; their destructors unhook widgets
}

int TreeRenderer::node_count() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return static_cast<int>(reg_.widgets.size());
}

WidgetPtr TreeRenderer::lookup(const std::string& id) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = reg_.widgets.find(id);
  return it == reg_.widgets.end() ? nullptr : it->second;
}

bool TreeRenderer::lookup_node(const std::string& id, WidgetPtr& out) const {
  out = lookup(id);
  return out != nullptr;
}

std::vector<std::string> TreeRenderer::node_ids() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  std::vector<std::string> ids;
  ids.reserve(reg_.widgets.size());
  for (const auto& kv : reg_.widgets) ids.push_back(kv.first);
  std::sort(ids.begin(), ids.end());
  return ids;
}

void TreeRenderer::register_widget(const std::string& id, WidgetPtr w) {
  if (id.empty() || !w) return;
  std::unique_lock<std::shared_mutex> lk(mu_);
  reg_.widgets[id] = std::move(w);
}

void TreeRenderer::unregister_widget(const std::string& id) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  reg_.widgets.erase(id);
}

std::shared_ptr<SplitView> TreeRenderer::split_view(const std::string& node_id) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = reg_.splits.find(node_id);
  return it == reg_.splits.end() ? nullptr : it->second;
}

std::shared_ptr<StackedView> TreeRenderer::stacked_view(const std::string& node_id) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = reg_.stacks.find(node_id);
  return it == reg_.stacks.end() ? nullptr : it->second;
}

std::shared_ptr<StackedView> TreeRenderer::stacked_view_for_pane(const std::string& pane_id) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = reg_.pane_to_stack.find(pane_id);
  return it == reg_.pane_to_stack.end() ? nullptr : it->second;
}

LayoutError TreeRenderer::update_split_ratio(const std::string& node_id, double ratio) {
  auto split = split_view(node_id);
  if (!split) return LayoutError::NodeNotFound;
  split->set_ratio(ratio);
  return LayoutError::None;
}

void TreeRenderer::set_on_split_ratio_changed(SplitRatioFn fn) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  on_split_ratio_changed_ = std::move(fn);
}

void TreeRenderer::set_on_stack_activate(PaneEventFn fn) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  on_stack_activate_ = std::move(fn);
}

void TreeRenderer::set_on_stack_close(PaneEventFn fn) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  on_stack_close_ = std::move(fn);
}

void TreeRenderer::forward_ratio(const std::string& node_id, double ratio) {
  SplitRatioFn fn;
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    fn = on_split_ratio_changed_;
  }
  if (fn) fn(node_id, ratio);
}

void TreeRenderer::forward_stack_activate(const std::weak_ptr<StackedView>& stack, int index) {
  auto st = stack.lock();
  std::string pane_id = st ? st->pane_id_at(index) : std::string();
  if (pane_id.empty()) return;
  PaneEventFn fn;
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    fn = on_stack_activate_;
  }
  if (fn) fn(pane_id);
}

void TreeRenderer::forward_stack_close(const std::string& pane_id) {
  PaneEventFn fn;
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    fn = on_stack_close_;
  }
  if (fn) fn(pane_id);
}
