#include "pane_view.hpp"

PaneView::PaneView(WidgetFactory& factory, const std::string& pane_id, const std::string& title)
  : pane_id_(pane_id), overlay_(factory.new_overlay()),
    body_(factory.new_box(Orientation::Vertical, 0)), header_(factory.new_label(title)) {
  overlay_->set_hexpand(true);
  overlay_->set_vexpand(true);
  overlay_->set_can_focus(true);
  overlay_->add_css_class("pane");
  header_->set_xalign(0.0f);
  header_->set_ellipsize(Ellipsize::Middle);
  header_->add_css_class("pane-header");
  body_->append(header_);
  overlay_->set_child(body_);
  press_id_ = overlay_->connect_pressed([this]{ if (on_pressed_) on_pressed_(); });
}

PaneView::~PaneView() { cleanup(); }

void PaneView::set_title(const std::string& title) { header_->set_text(title); }

std::string PaneView::title() const { return header_->text(); }

void PaneView::set_active(bool active) {
  active_ = active;
  if (active) {
    overlay_->add_css_class("pane-active");
    header_->add_css_class("pane-active");
  } else {
    overlay_->remove_css_class("pane-active");
    header_->remove_css_class("pane-active");
  }
}

bool PaneView::grab_focus() {
  if (content_ && content_->grab_focus()) return true;
  return overlay_->grab_focus();
}

void PaneView::set_content_widget(WidgetPtr content) {
  if (content_ == content) return;
  if (content_ && content_->parent() == body_.get()) body_->remove(content_.get());
  content_ = std::move(content);
  if (!content_) return;
  if (content_->parent()) content_->unparent();
  content_->set_hexpand(true);
  content_->set_vexpand(true);
  body_->append(content_);
}

void PaneView::add_overlay_widget(const WidgetPtr& w) {
  if (!w) return;
  if (w->parent()) w->unparent();
  overlay_->add_overlay(w);
  overlay_->set_clip_overlay(w.get(), true);
  overlay_->set_measure_overlay(w.get(), false);
}

void PaneView::remove_overlay_widget(const Widget* w) {
  if (w) overlay_->remove_overlay(w);
}

void PaneView::attach_hover_handler(Scheduler& sched, std::chrono::milliseconds delay,
                                    std::function<void()> on_hover) {
  hover_ = std::make_unique<HoverHandler>(sched, delay);
  hover_->attach(overlay_, std::move(on_hover));
}

void PaneView::cancel_pending_hover() {
  if (hover_) hover_->cancel();
}

void PaneView::set_on_pressed(std::function<void()> fn) { on_pressed_ = std::move(fn); }

void PaneView::cleanup() {
  on_pressed_ = nullptr;
  if (press_id_) { overlay_->disconnect(press_id_); press_id_ = 0; }
  if (hover_) { hover_->detach(); hover_.reset(); }
  if (content_) {
    if (content_->parent() == body_.get()) body_->remove(content_.get());
    content_.reset();
  }
}
