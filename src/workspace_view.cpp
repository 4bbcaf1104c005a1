#include "workspace_view.hpp"
#include <algorithm>
#include <mutex>

WorkspaceView::WorkspaceView(WidgetFactory& factory, Scheduler& sched, const Settings& settings)
  : factory_(factory), sched_(sched), settings_(settings),
    renderer_(factory, sched, this,
              SplitOptions{std::chrono::milliseconds(settings.ratio_notify_ms), settings.max_ratio_retry_frames}),
    container_(factory.new_box(Orientation::Vertical, 0)),
    alive_(std::make_shared<bool>(true)) {
  container_->set_hexpand(true);
  container_->set_vexpand(true);
  container_->add_css_class("workspace");
  renderer_.set_on_split_ratio_changed([this](const std::string& id, double r){
    RatioFn fn;
    {
      std::shared_lock<std::shared_mutex> lk(mu_);
      fn = on_split_ratio_dragged_;
    }
    if (fn) fn(id, r);
  });
  renderer_.set_on_stack_activate([this](const std::string& id){ on_stack_activated(id); });
  renderer_.set_on_stack_close([this](const std::string& id){ on_stack_close(id); });
}

WorkspaceView::~WorkspaceView() {
  std::unique_lock<std::shared_mutex> lk(mu_);
  teardown_overlays_locked();
  cleanup_pane_views_locked();
  alive_.reset();
}

void WorkspaceView::set_suggestion_source(std::shared_ptr<SuggestionSource> source, BackgroundWorker* worker) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  suggestions_ = std::move(source);
  worker_ = worker;
}

void WorkspaceView::set_find_controller_provider(FindControllerProvider provider) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  find_provider_ = std::move(provider);
}

// Runs inside set_workspace() while mu_ is held exclusively.
WidgetPtr WorkspaceView::create_pane_widget(const PaneNode& leaf) {
  const Pane& pane = *leaf.pane;
  auto view = std::make_shared<PaneView>(factory_, pane.id, pane.title.empty() ? pane.id : pane.title);
  if (content_factory_) {
    WidgetPtr content = content_factory_->create_content(pane);
    if (content) view->set_content_widget(std::move(content));
    else if (log_) log_->error("no content for pane " + pane.id);
  }
  std::string id = pane.id;
  view->attach_hover_handler(sched_, settings_.hover_delay(), [this, id]{ on_pane_hovered(id); });
  view->set_on_pressed([this, id]{ on_pane_pressed(id); });
  pane_views_[id] = view;
  return view->widget();
}

LayoutError WorkspaceView::set_workspace(Workspace* ws) {
  if (!ws) {
    report(LayoutError::NilWorkspace, "set workspace");
    return LayoutError::NilWorkspace;
  }
  LayoutError err;
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    teardown_overlays_locked();
    cleanup_pane_views_locked();
    if (root_widget_) {
      container_->remove(root_widget_.get());
      root_widget_.reset();
    }
    workspace_ = ws;
    WidgetPtr root;
    // an empty workspace renders nothing
    if (!ws->root) {
      renderer_.clear();
      err = LayoutError::None;
    } else {
      err = renderer_.build(ws->root.get(), root);
    }
    if (err != LayoutError::None) {
      cleanup_pane_views_locked();
    } else {
      if (root) {
        root_widget_ = root;
        container_->append(root);
      }
      if (ws->root && !ws->active_pane_id.empty()) err = activate_locked(ws->active_pane_id, true);
    }
    update_single_pane_class_locked();
  }
  report(err, "set workspace");
  return err;
}

LayoutError WorkspaceView::rebuild() {
  Workspace* ws;
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    ws = workspace_;
  }
  if (!ws) {
    report(LayoutError::NilWorkspace, "rebuild");
    return LayoutError::NilWorkspace;
  }
  return set_workspace(ws);
}

Workspace* WorkspaceView::workspace() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return workspace_;
}

LayoutError WorkspaceView::activate_locked(const std::string& pane_id, bool force) {
  auto it = pane_views_.find(pane_id);
  if (it == pane_views_.end()) return LayoutError::PaneNotFound;
  std::string prev = workspace_ ? workspace_->active_pane_id : std::string();
  if (prev != pane_id || force) {
    if (omnibox_ && omnibox_anchor_ != pane_id) teardown_omnibox_locked();
    if (find_bar_ && find_bar_anchor_ != pane_id) teardown_find_bar_locked();
    for (auto& kv : pane_views_) {
      if (kv.first != pane_id && kv.second->is_active()) kv.second->set_active(false);
    }
  }
  it->second->set_active(true);
  if (workspace_) {
    workspace_->active_pane_id = pane_id;
    set_stack_active(*workspace_, pane_id);
  }
  if (auto stack = renderer_.stacked_view_for_pane(pane_id)) {
    int idx = stack->find_pane_index(pane_id);
    if (idx >= 0 && idx != stack->active_index()) stack->set_active(idx);
  }
  return LayoutError::None;
}

LayoutError WorkspaceView::set_active_pane_id(const std::string& pane_id) {
  LayoutError err;
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    err = activate_locked(pane_id, false);
  }
  report(err, "activate " + pane_id);
  return err;
}

std::string WorkspaceView::active_pane_id() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return workspace_ ? workspace_->active_pane_id : std::string();
}

bool WorkspaceView::focus_pane(const std::string& pane_id) {
  if (set_active_pane_id(pane_id) != LayoutError::None) return false;
  auto view = pane_view(pane_id);
  if (view) view->grab_focus();
  return true;
}

std::shared_ptr<PaneView> WorkspaceView::pane_view(const std::string& pane_id) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  auto it = pane_views_.find(pane_id);
  return it == pane_views_.end() ? nullptr : it->second;
}

std::shared_ptr<PaneView> WorkspaceView::active_pane_view() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  if (!workspace_) return nullptr;
  auto it = pane_views_.find(workspace_->active_pane_id);
  return it == pane_views_.end() ? nullptr : it->second;
}

std::vector<std::string> WorkspaceView::pane_ids() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  std::vector<std::string> ids;
  for (const auto& kv : pane_views_) ids.push_back(kv.first);
  std::sort(ids.begin(), ids.end());
  return ids;
}

int WorkspaceView::pane_count() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return static_cast<int>(pane_views_.size());
}

void WorkspaceView::register_pane_view(const std::string& pane_id, std::shared_ptr<PaneView> view) {
  if (pane_id.empty() || !view) return;
  std::unique_lock<std::shared_mutex> lk(mu_);
  renderer_.register_widget(pane_id, view->widget());
  pane_views_[pane_id] = std::move(view);
  update_single_pane_class_locked();
}

void WorkspaceView::unregister_pane_view(const std::string& pane_id) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  auto it = pane_views_.find(pane_id);
  if (it == pane_views_.end()) return;
  if (omnibox_ && omnibox_anchor_ == pane_id) teardown_omnibox_locked();
  if (find_bar_ && find_bar_anchor_ == pane_id) teardown_find_bar_locked();
  it->second->cleanup();
  pane_views_.erase(it);
  renderer_.unregister_widget(pane_id);
  update_single_pane_class_locked();
}

LayoutError WorkspaceView::set_content_widget(const std::string& pane_id, WidgetPtr w) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  auto it = pane_views_.find(pane_id);
  if (it == pane_views_.end()) return LayoutError::PaneNotFound;
  it->second->set_content_widget(std::move(w));
  return LayoutError::None;
}

WidgetPtr WorkspaceView::stack_container_widget(const std::string& pane_id) const {
  auto stack = renderer_.stacked_view_for_pane(pane_id);
  if (!stack) return nullptr;
  WidgetPtr out;
  if (stack->container(stack->find_pane_index(pane_id), out) != LayoutError::None) return nullptr;
  return out;
}

WidgetPtr WorkspaceView::pane_widget(const std::string& pane_id) const {
  auto view = pane_view(pane_id);
  return view ? view->widget() : nullptr;
}

bool WorkspaceView::show_omnibox(const std::string& query) {
  std::shared_ptr<Omnibox> box;
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    if (!workspace_) return false;
    std::string active = workspace_->active_pane_id;
    auto it = pane_views_.find(active);
    if (it == pane_views_.end()) return false;
    if (omnibox_ && omnibox_anchor_ != active) teardown_omnibox_locked();
    if (!omnibox_) {
      if (!worker_) {
        if (log_) log_->error("omnibox unavailable: no background worker");
        return false;
      }
      OmniboxOptions opts;
      opts.debounce = std::chrono::milliseconds(settings_.omnibox_debounce_ms);
      opts.max_results = static_cast<size_t>(settings_.omnibox_max_results);
      omnibox_ = std::make_shared<Omnibox>(factory_, sched_, *worker_, suggestions_, opts);
      omnibox_->set_on_navigate([this](const std::string& t){ on_omnibox_navigate(t); });
      it->second->add_overlay_widget(omnibox_->widget());
      omnibox_anchor_ = active;
    }
    box = omnibox_;
  }
  box->show(query);
  return true;
}

void WorkspaceView::hide_omnibox() {
  std::shared_ptr<Omnibox> box = omnibox();
  if (box) box->hide();
}

bool WorkspaceView::is_omnibox_visible() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return omnibox_ && omnibox_->is_visible();
}

std::shared_ptr<Omnibox> WorkspaceView::omnibox() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return omnibox_;
}

std::string WorkspaceView::omnibox_anchor() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return omnibox_anchor_;
}

bool WorkspaceView::show_find_bar() {
  FindBar* bar = nullptr;
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    if (!workspace_) return false;
    std::string active = workspace_->active_pane_id;
    auto it = pane_views_.find(active);
    if (it == pane_views_.end()) return false;
    FindController* controller = find_provider_ ? find_provider_(active) : nullptr;
    if (!controller) {
      if (log_) log_->error("pane " + active + " has nothing to search");
      return false;
    }
    if (find_bar_ && find_bar_anchor_ != active) teardown_find_bar_locked();
    if (!find_bar_) {
      find_bar_ = std::make_unique<FindBar>(factory_, sched_, std::chrono::milliseconds(settings_.find_debounce_ms));
      it->second->add_overlay_widget(find_bar_->widget());
      find_bar_anchor_ = active;
    }
    find_bar_->bind(controller);
    bar = find_bar_.get();
  }
  bar->show();
  return true;
}

void WorkspaceView::hide_find_bar() {
  FindBar* bar = find_bar();
  if (bar) bar->hide();
}

bool WorkspaceView::is_find_bar_visible() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return find_bar_ && find_bar_->is_visible();
}

void WorkspaceView::find_next() {
  FindBar* bar = find_bar();
  if (bar && bar->controller()) bar->next();
}

void WorkspaceView::find_previous() {
  FindBar* bar = find_bar();
  if (bar && bar->controller()) bar->previous();
}

FindBar* WorkspaceView::find_bar() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  if (!find_bar_ || !workspace_ || find_bar_anchor_ != workspace_->active_pane_id) return nullptr;
  return find_bar_.get();
}

std::string WorkspaceView::find_bar_anchor() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return find_bar_anchor_;
}

void WorkspaceView::suppress_hover(std::chrono::milliseconds d) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  suppress_until_ = std::max(suppress_until_, sched_.now() + d);
}

bool WorkspaceView::is_hover_suppressed() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return sched_.now() < suppress_until_;
}

void WorkspaceView::cancel_all_pending_hovers() {
  std::shared_lock<std::shared_mutex> lk(mu_);
  for (const auto& kv : pane_views_) kv.second->cancel_pending_hover();
}

void WorkspaceView::set_on_pane_focused(PaneFn fn) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  on_pane_focused_ = std::move(fn);
}

void WorkspaceView::set_on_split_ratio_dragged(RatioFn fn) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  on_split_ratio_dragged_ = std::move(fn);
}

void WorkspaceView::set_on_close_pane(PaneFn fn) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  on_close_pane_ = std::move(fn);
}

void WorkspaceView::set_on_navigate(NavigateFn fn) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  on_navigate_ = std::move(fn);
}

void WorkspaceView::teardown_overlays_locked() {
  teardown_omnibox_locked();
  teardown_find_bar_locked();
}

void WorkspaceView::teardown_omnibox_locked() {
  if (!omnibox_) return;
  omnibox_->hide();
  WidgetPtr w = omnibox_->widget();
  auto it = pane_views_.find(omnibox_anchor_);
  if (it != pane_views_.end() && w->parent() == it->second->overlay().get()) {
    it->second->remove_overlay_widget(w.get());
  } else if (w->parent()) {
    w->unparent();
  }
  omnibox_.reset();
  omnibox_anchor_.clear();
}

void WorkspaceView::teardown_find_bar_locked() {
  if (!find_bar_) return;
  find_bar_->hide();
  find_bar_->unbind();
  WidgetPtr w = find_bar_->widget();
  auto it = pane_views_.find(find_bar_anchor_);
  if (it != pane_views_.end() && w->parent() == it->second->overlay().get()) {
    it->second->remove_overlay_widget(w.get());
  } else if (w->parent()) {
    w->unparent();
  }
  find_bar_.reset();
  find_bar_anchor_.clear();
}

void WorkspaceView::cleanup_pane_views_locked() {
  for (auto& kv : pane_views_) kv.second->cleanup();
  pane_views_.clear();
}

void WorkspaceView::update_single_pane_class_locked() {
  if (pane_views_.size() <= 1) container_->add_css_class("single-pane");
  else container_->remove_css_class("single-pane");
}

void WorkspaceView::on_pane_hovered(const std::string& pane_id) {
  if (!settings_.focus_follows_mouse) return;
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    if (sched_.now() < suppress_until_) return;
    if (!workspace_ || workspace_->active_pane_id == pane_id) return;
    if (activate_locked(pane_id, false) != LayoutError::None) return;
  }
  notify_focused(pane_id);
}

void WorkspaceView::on_pane_pressed(const std::string& pane_id) {
  bool changed;
  {
    std::unique_lock<std::shared_mutex> lk(mu_);
    if (!workspace_) return;
    changed = workspace_->active_pane_id != pane_id;
    if (changed && activate_locked(pane_id, false) != LayoutError::None) return;
  }
  if (changed) notify_focused(pane_id);
}

void WorkspaceView::on_stack_activated(const std::string& pane_id) {
  if (set_active_pane_id(pane_id) == LayoutError::None) notify_focused(pane_id);
}

void WorkspaceView::on_stack_close(const std::string& pane_id) {
  // deferred: the close handler rebuilds the tree that is dispatching this click
  std::weak_ptr<bool> alive = alive_;
  sched_.post([this, alive, pane_id]{
    if (!alive.lock()) return;
    PaneFn fn;
    {
      std::shared_lock<std::shared_mutex> lk(mu_);
      fn = on_close_pane_;
    }
    if (fn) fn(pane_id);
  });
}

void WorkspaceView::on_omnibox_navigate(const std::string& target) {
  NavigateFn fn;
  std::string anchor;
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    fn = on_navigate_;
    anchor = omnibox_anchor_;
  }
  if (fn) fn(anchor, target);
}

void WorkspaceView::notify_focused(const std::string& pane_id) {
  PaneFn fn;
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    fn = on_pane_focused_;
  }
  if (fn) fn(pane_id);
}

void WorkspaceView::report(LayoutError err, const std::string& what) {
  if (err != LayoutError::None && log_) log_->error(what + ": " + layout_error_message(err));
}
