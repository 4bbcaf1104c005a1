#pragma once
/*
 * Widget abstraction
 *
 * Purpose: toolkit-agnostic widget interfaces used by the layout engine.
 * Goal: the engine only talks to these; a backend (ncurses, headless) implements
 * them behind WidgetFactory, so layout code is testable without a real terminal.
 * Ownership: factories return shared_ptr; a container holds its children,
 * parent() is a non-owning back pointer.
 */
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

struct Rect {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;
};

inline bool rect_contains(const Rect& r, int row, int col) {
  return row >= r.row && row < r.row + r.height && col >= r.col && col < r.col + r.width;
}

enum class Orientation { Horizontal, Vertical };
enum class Align { Fill, Start, Center, End };
enum class Ellipsize { None, Start, Middle, End };

using SignalId = std::uint32_t;

class Widget {
public:
  virtual ~Widget() = default;

  virtual void set_visible(bool visible) = 0;
  virtual bool is_visible() const = 0;
  void show() { set_visible(true); }
  void hide() { set_visible(false); }

  virtual bool grab_focus() = 0;
  virtual bool has_focus() const = 0;
  virtual void set_can_focus(bool can_focus) = 0;
  // false: pointer events pass through this widget
  virtual void set_can_target(bool can_target) = 0;

  virtual void set_hexpand(bool expand) = 0;
  virtual void set_vexpand(bool expand) = 0;
  virtual bool hexpand() const = 0;
  virtual bool vexpand() const = 0;
  virtual void set_halign(Align align) = 0;
  virtual void set_valign(Align align) = 0;
  // -1 keeps the natural size for that axis
  virtual void set_size_request(int width, int height) = 0;

  virtual int allocated_width() const = 0;
  virtual int allocated_height() const = 0;
  virtual Rect allocation() const = 0;
  virtual bool is_mapped() const = 0;

  virtual void add_css_class(const std::string& cls) = 0;
  virtual void remove_css_class(const std::string& cls) = 0;
  virtual bool has_css_class(const std::string& cls) const = 0;

  virtual void unparent() = 0;
  virtual Widget* parent() const = 0;

  // Pointer signals. Handlers run on the UI loop.
  virtual SignalId connect_pressed(std::function<void()> fn) = 0;
  virtual SignalId connect_enter(std::function<void()> fn) = 0;
  virtual SignalId connect_leave(std::function<void()> fn) = 0;
  virtual void disconnect(SignalId id) = 0;
};

using WidgetPtr = std::shared_ptr<Widget>;

class PanedWidget : public Widget {
public:
  virtual void set_start_child(WidgetPtr child) = 0;
  virtual void set_end_child(WidgetPtr child) = 0;
  virtual WidgetPtr start_child() const = 0;
  virtual WidgetPtr end_child() const = 0;

  virtual void set_position(int position) = 0;
  virtual int position() const = 0;
  virtual Orientation orientation() const = 0;

  virtual void set_resize_start_child(bool resize) = 0;
  virtual void set_resize_end_child(bool resize) = 0;
  virtual void set_wide_handle(bool wide) = 0;

  virtual SignalId connect_map(std::function<void()> fn) = 0;
  // fired when the user moves the divider, not for set_position()
  virtual SignalId connect_notify_position(std::function<void()> fn) = 0;
  // callback returns true to keep ticking, false to stop
  virtual SignalId add_tick_callback(std::function<bool()> fn) = 0;
  virtual void remove_tick_callback(SignalId id) = 0;
};

class BoxWidget : public Widget {
public:
  virtual void append(WidgetPtr child) = 0;
  virtual void prepend(WidgetPtr child) = 0;
  virtual void remove(const Widget* child) = 0;
  virtual void insert_child_after(WidgetPtr child, const Widget* sibling) = 0;
  virtual void remove_all() = 0;
  virtual int child_count() const = 0;
  virtual void set_spacing(int spacing) = 0;
  virtual Orientation orientation() const = 0;
};

class OverlayWidget : public Widget {
public:
  virtual void set_child(WidgetPtr child) = 0;
  virtual WidgetPtr child() const = 0;
  virtual void add_overlay(WidgetPtr overlay) = 0;
  virtual void remove_overlay(const Widget* overlay) = 0;
  virtual int overlay_count() const = 0;
  virtual void set_clip_overlay(const Widget* overlay, bool clip) = 0;
  virtual void set_measure_overlay(const Widget* overlay, bool measure) = 0;
};

class LabelWidget : public Widget {
public:
  virtual void set_text(const std::string& text) = 0;
  virtual std::string text() const = 0;
  virtual void set_ellipsize(Ellipsize mode) = 0;
  virtual void set_max_width_chars(int chars) = 0;
  virtual void set_xalign(float xalign) = 0;
};

class ButtonWidget : public Widget {
public:
  virtual void set_label(const std::string& label) = 0;
  virtual std::string label() const = 0;
  virtual void set_icon_name(const std::string& icon) = 0;
  virtual void set_focus_on_click(bool focus) = 0;
  virtual SignalId connect_clicked(std::function<void()> fn) = 0;
};

class ImageWidget : public Widget {
public:
  virtual void set_from_icon_name(const std::string& icon) = 0;
  virtual std::string icon_name() const = 0;
  virtual void set_pixel_size(int size) = 0;
  virtual void clear() = 0;
};

class SpinnerWidget : public Widget {
public:
  virtual void set_spinning(bool spinning) = 0;
  virtual bool spinning() const = 0;
  void start() { set_spinning(true); }
  void stop() { set_spinning(false); }
};

class WidgetFactory {
public:
  virtual ~WidgetFactory() = default;
  virtual std::shared_ptr<PanedWidget> new_paned(Orientation orientation) = 0;
  virtual std::shared_ptr<BoxWidget> new_box(Orientation orientation, int spacing) = 0;
  virtual std::shared_ptr<OverlayWidget> new_overlay() = 0;
  virtual std::shared_ptr<LabelWidget> new_label(const std::string& text) = 0;
  virtual std::shared_ptr<ButtonWidget> new_button() = 0;
  virtual std::shared_ptr<ImageWidget> new_image() = 0;
  virtual std::shared_ptr<SpinnerWidget> new_spinner() = 0;
};
