#include "stacked_view.hpp"
#include <algorithm>
#include <mutex>

StackedView::StackedView(WidgetFactory& factory)
  : factory_(factory), box_(factory.new_box(Orientation::Vertical, 0)) {
  box_->set_hexpand(true);
  box_->set_vexpand(true);
  box_->add_css_class("stacked");
}

StackedView::~StackedView() {
  for (auto& e : entries_) disconnect_entry(e);
}

StackedView::Entry StackedView::make_entry(const std::string& pane_id, const std::string& title,
                                           const std::string& icon, WidgetPtr content) {
  Entry e;
  e.pane_id = pane_id;
  e.title = title;
  e.icon = icon;
  e.content = std::move(content);
  e.container = factory_.new_box(Orientation::Vertical, 0);
  e.container->set_hexpand(true);
  e.title_bar = factory_.new_box(Orientation::Horizontal, 1);
  e.title_bar->set_hexpand(true);
  e.title_bar->add_css_class("stack-title");

  e.icon_image = factory_.new_image();
  if (!icon.empty()) e.icon_image->set_from_icon_name(icon);
  e.title_label = factory_.new_label(title);
  e.title_label->set_hexpand(true);
  e.title_label->set_xalign(0.0f);
  e.title_label->set_ellipsize(Ellipsize::End);
  e.close_button = factory_.new_button();
  e.close_button->set_icon_name("window-close");
  e.close_button->set_focus_on_click(false);
  e.title_bar->append(e.icon_image);
  e.title_bar->append(e.title_label);
  e.title_bar->append(e.close_button);

  e.container->append(e.title_bar);
  if (e.content) {
    e.content->set_vexpand(true);
    e.content->set_hexpand(true);
    e.container->append(e.content);
  }
  e.press_id = e.title_bar->connect_pressed([this, pane_id]{ on_title_pressed(pane_id); });
  e.close_id = e.close_button->connect_clicked([this, pane_id]{ on_close_clicked(pane_id); });
  return e;
}

void StackedView::disconnect_entry(Entry& e) {
  if (e.press_id) { e.title_bar->disconnect(e.press_id); e.press_id = 0; }
  if (e.close_id) { e.close_button->disconnect(e.close_id); e.close_id = 0; }
}

int StackedView::add_pane(const std::string& pane_id, const std::string& title,
                          const std::string& icon, WidgetPtr content) {
  Entry e = make_entry(pane_id, title, icon, std::move(content));
  std::unique_lock<std::shared_mutex> lk(mu_);
  box_->append(e.container);
  entries_.push_back(std::move(e));
  active_ = static_cast<int>(entries_.size()) - 1;
  apply_visibility_locked();
  return active_;
}

int StackedView::insert_pane_after(int after, const std::string& pane_id, const std::string& title,
                                   const std::string& icon, WidgetPtr content) {
  Entry e = make_entry(pane_id, title, icon, std::move(content));
  std::unique_lock<std::shared_mutex> lk(mu_);
  int n = static_cast<int>(entries_.size());
  int index;
  if (after < 0 || n == 0) {
    index = 0;
    box_->prepend(e.container);
  } else if (after >= n - 1) {
    index = n;
    box_->append(e.container);
  } else {
    index = after + 1;
    box_->insert_child_after(e.container, entries_[after].container.get());
  }
  entries_.insert(entries_.begin() + index, std::move(e));
  active_ = index;
  apply_visibility_locked();
  return index;
}

LayoutError StackedView::remove_pane(int index) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  int n = static_cast<int>(entries_.size());
  if (n == 0) return LayoutError::StackEmpty;
  if (index < 0 || index >= n) return LayoutError::IndexOutOfBounds;
  if (n == 1) return LayoutError::CannotRemoveLastPane;
  Entry& e = entries_[index];
  disconnect_entry(e);
  box_->remove(e.container.get());
  entries_.erase(entries_.begin() + index);
  n--;
  if (index < active_) active_--;
  else if (index == active_) active_ = std::min(index, n - 1);
  apply_visibility_locked();
  return LayoutError::None;
}

LayoutError StackedView::set_active(int index) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  if (entries_.empty()) return LayoutError::StackEmpty;
  if (index < 0 || index >= static_cast<int>(entries_.size())) return LayoutError::IndexOutOfBounds;
  active_ = index;
  apply_visibility_locked();
  return LayoutError::None;
}

LayoutError StackedView::navigate_next() {
  int target;
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    if (entries_.empty()) return LayoutError::StackEmpty;
    int n = static_cast<int>(entries_.size());
    target = (active_ + 1) % n;
  }
  return set_active(target);
}

LayoutError StackedView::navigate_previous() {
  int target;
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    if (entries_.empty()) return LayoutError::StackEmpty;
    int n = static_cast<int>(entries_.size());
    target = (active_ - 1 + n) % n;
  }
  return set_active(target);
}

void StackedView::apply_visibility_locked() {
  for (int i = 0; i < static_cast<int>(entries_.size()); ++i) {
    Entry& e = entries_[i];
    bool active = (i == active_);
    e.title_bar->set_visible(!active);
    if (active) e.title_bar->add_css_class("active");
    else e.title_bar->remove_css_class("active");
    if (e.content) e.content->set_visible(active);
    e.container->set_vexpand(active);
  }
}

int StackedView::count() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return static_cast<int>(entries_.size());
}

int StackedView::active_index() const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return entries_.empty() ? -1 : active_;
}

int StackedView::find_locked(const std::string& pane_id) const {
  for (size_t i = 0; i < entries_.size(); ++i) {
    if (entries_[i].pane_id == pane_id) return static_cast<int>(i);
  }
  return -1;
}

int StackedView::find_pane_index(const std::string& pane_id) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  return find_locked(pane_id);
}

std::string StackedView::pane_id_at(int index) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  if (index < 0 || index >= static_cast<int>(entries_.size())) return std::string();
  return entries_[index].pane_id;
}

LayoutError StackedView::update_title(int index, const std::string& title) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  if (entries_.empty()) return LayoutError::StackEmpty;
  if (index < 0 || index >= static_cast<int>(entries_.size())) return LayoutError::IndexOutOfBounds;
  entries_[index].title = title;
  entries_[index].title_label->set_text(title);
  return LayoutError::None;
}

LayoutError StackedView::update_icon(int index, const std::string& icon) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  if (entries_.empty()) return LayoutError::StackEmpty;
  if (index < 0 || index >= static_cast<int>(entries_.size())) return LayoutError::IndexOutOfBounds;
  entries_[index].icon = icon;
  if (icon.empty()) entries_[index].icon_image->clear();
  else entries_[index].icon_image->set_from_icon_name(icon);
  return LayoutError::None;
}

LayoutError StackedView::container(int index, WidgetPtr& out) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  if (entries_.empty()) return LayoutError::StackEmpty;
  if (index < 0 || index >= static_cast<int>(entries_.size())) return LayoutError::IndexOutOfBounds;
  out = entries_[index].container;
  return LayoutError::None;
}

LayoutError StackedView::content(int index, WidgetPtr& out) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  if (entries_.empty()) return LayoutError::StackEmpty;
  if (index < 0 || index >= static_cast<int>(entries_.size())) return LayoutError::IndexOutOfBounds;
  out = entries_[index].content;
  return LayoutError::None;
}

LayoutError StackedView::title_bar(int index, WidgetPtr& out) const {
  std::shared_lock<std::shared_mutex> lk(mu_);
  if (entries_.empty()) return LayoutError::StackEmpty;
  if (index < 0 || index >= static_cast<int>(entries_.size())) return LayoutError::IndexOutOfBounds;
  out = entries_[index].title_bar;
  return LayoutError::None;
}

void StackedView::set_on_activate(ActivateFn fn) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  on_activate_ = std::move(fn);
}

void StackedView::set_on_close_pane(CloseFn fn) {
  std::unique_lock<std::shared_mutex> lk(mu_);
  on_close_pane_ = std::move(fn);
}

void StackedView::on_title_pressed(const std::string& pane_id) {
  int index = find_pane_index(pane_id);
  if (index < 0) return;
  if (set_active(index) != LayoutError::None) return;
  ActivateFn fn;
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    fn = on_activate_;
  }
  if (fn) fn(index);
}

void StackedView::on_close_clicked(const std::string& pane_id) {
  CloseFn fn;
  {
    std::shared_lock<std::shared_mutex> lk(mu_);
    fn = on_close_pane_;
  }
  if (fn) fn(pane_id);
}
