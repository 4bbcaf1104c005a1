#pragma once
/*
 * StackedView
 *
 * Purpose: ordered tab-group of panes with exactly one active entry.
 * Layout: a vertical box of entry containers; each container is
 * [title bar (icon, title, close button), content]. Inactive entries show only
 * their title bar; the active entry hides its title bar and shows its content.
 * Events: a title-bar press activates the entry and reports on_activate(index);
 * the close button reports on_close_pane(pane_id).
 */
#include "layout_error.hpp"
#include "widget.hpp"
#include <functional>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

class StackedView {
public:
  using ActivateFn = std::function<void(int index)>;
  using CloseFn = std::function<void(const std::string& pane_id)>;

  explicit StackedView(WidgetFactory& factory);
  ~StackedView();
  StackedView(const StackedView&) = delete;
  StackedView& operator=(const StackedView&) = delete;

  WidgetPtr widget() const { return box_; }

  int add_pane(const std::string& pane_id, const std::string& title, const std::string& icon, WidgetPtr content);
  // after == -1 inserts at the front; after >= count-1 appends
  int insert_pane_after(int after, const std::string& pane_id, const std::string& title,
                        const std::string& icon, WidgetPtr content);
  LayoutError remove_pane(int index);
  LayoutError set_active(int index);
  LayoutError navigate_next();
  LayoutError navigate_previous();

  int count() const;
  int active_index() const;
  int find_pane_index(const std::string& pane_id) const;
  std::string pane_id_at(int index) const;
  LayoutError update_title(int index, const std::string& title);
  LayoutError update_icon(int index, const std::string& icon);
  LayoutError container(int index, WidgetPtr& out) const;
  LayoutError content(int index, WidgetPtr& out) const;
  LayoutError title_bar(int index, WidgetPtr& out) const;

  void set_on_activate(ActivateFn fn);
  void set_on_close_pane(CloseFn fn);

private:
  struct Entry {
    std::string pane_id;
    std::string title;
    std::string icon;
    WidgetPtr content;
    std::shared_ptr<BoxWidget> container;
    std::shared_ptr<BoxWidget> title_bar;
    std::shared_ptr<ImageWidget> icon_image;
    std::shared_ptr<LabelWidget> title_label;
    std::shared_ptr<ButtonWidget> close_button;
    SignalId press_id = 0;
    SignalId close_id = 0;
  };

  Entry make_entry(const std::string& pane_id, const std::string& title,
                   const std::string& icon, WidgetPtr content);
  void disconnect_entry(Entry& e);
  void apply_visibility_locked();
  void on_title_pressed(const std::string& pane_id);
  void on_close_clicked(const std::string& pane_id);
  int find_locked(const std::string& pane_id) const;

  WidgetFactory& factory_;
  std::shared_ptr<BoxWidget> box_;
  mutable std::shared_mutex mu_;
  std::vector<Entry> entries_;
  int active_ = -1;
  ActivateFn on_activate_;
  CloseFn on_close_pane_;
};
