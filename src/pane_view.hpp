#pragma once
/*
 * PaneView
 *
 * Purpose: chrome around one leaf pane.
 * Layout: an overlay whose main child is a vertical box [header, content];
 * pane-anchored popups (omnibox, find bar) are added as overlays on top.
 * State: set_active() toggles the "pane-active" style class.
 * Lifecycle: cleanup() must run before the hosted content is destroyed; it
 * drops callbacks, detaches the hover handler and unparents the content.
 */
#include "hover_handler.hpp"
#include "scheduler.hpp"
#include "widget.hpp"
#include <functional>
#include <memory>
#include <string>

class PaneView {
public:
  PaneView(WidgetFactory& factory, const std::string& pane_id, const std::string& title);
  ~PaneView();
  PaneView(const PaneView&) = delete;
  PaneView& operator=(const PaneView&) = delete;

  const std::string& pane_id() const { return pane_id_; }
  WidgetPtr widget() const { return overlay_; }
  std::shared_ptr<OverlayWidget> overlay() const { return overlay_; }
  WidgetPtr content_widget() const { return content_; }

  void set_title(const std::string& title);
  std::string title() const;
  void set_active(bool active);
  bool is_active() const { return active_; }
  bool grab_focus();

  void set_content_widget(WidgetPtr content);
  void add_overlay_widget(const WidgetPtr& w);
  void remove_overlay_widget(const Widget* w);

  void attach_hover_handler(Scheduler& sched, std::chrono::milliseconds delay, std::function<void()> on_hover);
  void cancel_pending_hover();
  bool hover_pending() const { return hover_ && hover_->pending(); }

  void set_on_pressed(std::function<void()> fn);
  void cleanup();

private:
  std::string pane_id_;
  std::shared_ptr<OverlayWidget> overlay_;
  std::shared_ptr<BoxWidget> body_;
  std::shared_ptr<LabelWidget> header_;
  WidgetPtr content_;
  std::unique_ptr<HoverHandler> hover_;
  std::function<void()> on_pressed_;
  SignalId press_id_ = 0;
  bool active_ = false;
};
