#pragma once
/*
 * Terminal widgets
 *
 * Purpose: WidgetFactory implementation that lays out and draws widgets on a
 * character grid through ITerminal (ncurses in the app, headless in tests).
 * Lifecycle: a widget has a zero allocation until the renderer's layout pass;
 * map handlers fire when it first becomes visible under a mapped parent;
 * tick callbacks run once per frame from the factory's FrameClock.
 * Pointer: hit_path()/dispatch_press() route clicks to the deepest widget
 * with press handlers; PointerTracker turns motion into enter/leave.
 * Note: the factory must outlive every widget it created.
 */
#include "iterminal.hpp"
#include "widget.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

class TermNode;

class FrameClock {
public:
  SignalId add(std::function<bool()> fn);
  void remove(SignalId id);
  // runs every callback once; callbacks returning false are dropped
  void tick();
  std::uint64_t frame() const { return frame_; }
  size_t size() const { return callbacks_.size(); }
private:
  std::map<SignalId, std::function<bool()>> callbacks_;
  SignalId next_id_ = 1;
  std::uint64_t frame_ = 0;
};

class TermContext {
public:
  FrameClock& clock() { return clock_; }
  const FrameClock& clock() const { return clock_; }
  SignalId next_signal_id() { return next_signal_++; }
  TermNode* focus() const { return focus_; }
  void set_focus(TermNode* n) { focus_ = n; }
  void add_live(const TermNode* n) { live_.insert(n); }
  void remove_live(const TermNode* n);
  bool is_live(const TermNode* n) const { return live_.count(n) > 0; }
  size_t live_count() const { return live_.size(); }
private:
  FrameClock clock_;
  SignalId next_signal_ = 1;
  TermNode* focus_ = nullptr;
  std::unordered_set<const TermNode*> live_;
};

class TermNode {
public:
  explicit TermNode(TermContext& ctx);
  virtual ~TermNode();
  TermNode(const TermNode&) = delete;
  TermNode& operator=(const TermNode&) = delete;

  virtual Widget* as_widget() = 0;
  // natural size, before size requests
  virtual void measure(int& width, int& height) const { width = 0; height = 0; }
  virtual void layout(const Rect& area) { alloc_ = area; }
  virtual void draw(ITerminal& term) const { (void)term; }
  virtual void children(std::vector<TermNode*>& out) const { (void)out; }
  virtual void remove_child(const Widget* child) { (void)child; }
  virtual bool expands(Orientation o) const { return o == Orientation::Horizontal ? hexpand_ : vexpand_; }
  // fires press handlers; true when someone listened
  virtual bool press();

  void preferred_size(int& width, int& height) const;
  void sync_mapped(bool parent_mapped);
  void unmap();
  void enter();
  void leave();

  bool node_visible() const { return visible_; }
  bool node_targetable() const { return can_target_; }
  bool node_mapped() const { return mapped_; }
  const Rect& alloc() const { return alloc_; }
  Widget* node_parent() const { return parent_; }
  void set_node_parent(Widget* p) { parent_ = p; }
  bool has_class(const std::string& cls) const { return css_.count(cls) > 0; }
  Align node_halign() const { return halign_; }
  Align node_valign() const { return valign_; }

protected:
  using Handlers = std::vector<std::pair<SignalId, std::function<void()>>>;
  SignalId connect_to(Handlers& hs, std::function<void()> fn);
  bool disconnect_id(SignalId id);
  virtual bool disconnect_extra(SignalId id) { (void)id; return false; }
  static void fire(Handlers hs);
  static bool erase_handler(Handlers& hs, SignalId id);
  void attach_child(const WidgetPtr& child);
  void release_child(const WidgetPtr& child);
  void layout_hidden(const WidgetPtr& child);

  TermContext& ctx_;
  Widget* parent_ = nullptr;
  bool visible_ = true;
  bool mapped_ = false;
  bool can_focus_ = false;
  bool can_target_ = true;
  bool hexpand_ = false;
  bool vexpand_ = false;
  Align halign_ = Align::Fill;
  Align valign_ = Align::Fill;
  int req_w_ = -1;
  int req_h_ = -1;
  Rect alloc_{};
  std::set<std::string> css_;
  Handlers pressed_;
  Handlers enter_;
  Handlers leave_;
  Handlers map_;
};

TermNode* term_node(const Widget* w);

template <class Iface>
class TermWidget : public Iface, public TermNode {
public:
  explicit TermWidget(TermContext& ctx) : TermNode(ctx) {}

  Widget* as_widget() override { return this; }

  void set_visible(bool visible) override {
    visible_ = visible;
    if (!visible) unmap();
  }
  bool is_visible() const override { return visible_; }

  bool grab_focus() override {
    if (!can_focus_ || !visible_) return false;
    ctx_.set_focus(this);
    return true;
  }
  bool has_focus() const override { return ctx_.focus() == static_cast<const TermNode*>(this); }
  void set_can_focus(bool can_focus) override { can_focus_ = can_focus; }
  void set_can_target(bool can_target) override { can_target_ = can_target; }

  void set_hexpand(bool expand) override { hexpand_ = expand; }
  void set_vexpand(bool expand) override { vexpand_ = expand; }
  bool hexpand() const override { return hexpand_; }
  bool vexpand() const override { return vexpand_; }
  void set_halign(Align align) override { halign_ = align; }
  void set_valign(Align align) override { valign_ = align; }
  void set_size_request(int width, int height) override { req_w_ = width; req_h_ = height; }

  int allocated_width() const override { return alloc_.width; }
  int allocated_height() const override { return alloc_.height; }
  Rect allocation() const override { return alloc_; }
  bool is_mapped() const override { return mapped_; }

  void add_css_class(const std::string& cls) override { css_.insert(cls); }
  void remove_css_class(const std::string& cls) override { css_.erase(cls); }
  bool has_css_class(const std::string& cls) const override { return css_.count(cls) > 0; }

  void unparent() override {
    Widget* p = parent_;
    parent_ = nullptr;
    // may release the last reference to this widget
    if (TermNode* n = term_node(p)) n->remove_child(this);
  }
  Widget* parent() const override { return parent_; }

  SignalId connect_pressed(std::function<void()> fn) override { return connect_to(pressed_, std::move(fn)); }
  SignalId connect_enter(std::function<void()> fn) override { return connect_to(enter_, std::move(fn)); }
  SignalId connect_leave(std::function<void()> fn) override { return connect_to(leave_, std::move(fn)); }
  void disconnect(SignalId id) override { disconnect_id(id); }
};

class TermBox : public TermWidget<BoxWidget> {
public:
  TermBox(TermContext& ctx, Orientation orientation, int spacing);
  ~TermBox() override;

  void append(WidgetPtr child) override;
  void prepend(WidgetPtr child) override;
  void remove(const Widget* child) override;
  void insert_child_after(WidgetPtr child, const Widget* sibling) override;
  void remove_all() override;
  int child_count() const override { return static_cast<int>(children_.size()); }
  void set_spacing(int spacing) override { spacing_ = spacing < 0 ? 0 : spacing; }
  Orientation orientation() const override { return orientation_; }

  void measure(int& width, int& height) const override;
  void layout(const Rect& area) override;
  void draw(ITerminal& term) const override;
  void children(std::vector<TermNode*>& out) const override;
  void remove_child(const Widget* child) override { remove(child); }
  bool expands(Orientation o) const override;

private:
  Orientation orientation_;
  int spacing_;
  std::vector<WidgetPtr> children_;
};

class TermPaned : public TermWidget<PanedWidget> {
public:
  TermPaned(TermContext& ctx, Orientation orientation);
  ~TermPaned() override;

  void set_start_child(WidgetPtr child) override;
  void set_end_child(WidgetPtr child) override;
  WidgetPtr start_child() const override { return start_; }
  WidgetPtr end_child() const override { return end_; }
  void set_position(int position) override;
  int position() const override { return position_; }
  Orientation orientation() const override { return orientation_; }
  void set_resize_start_child(bool resize) override { resize_start_ = resize; }
  void set_resize_end_child(bool resize) override { resize_end_ = resize; }
  void set_wide_handle(bool wide) override { wide_handle_ = wide; }
  SignalId connect_map(std::function<void()> fn) override { return connect_to(map_, std::move(fn)); }
  SignalId connect_notify_position(std::function<void()> fn) override { return connect_to(notify_position_, std::move(fn)); }
  SignalId add_tick_callback(std::function<bool()> fn) override;
  void remove_tick_callback(SignalId id) override;

  // user divider drag (keyboard or mouse); notifies position listeners
  void drag(int delta);
  bool position_set() const { return position_set_; }
  Rect divider_rect() const;

  void measure(int& width, int& height) const override;
  void layout(const Rect& area) override;
  void draw(ITerminal& term) const override;
  void children(std::vector<TermNode*>& out) const override;
  void remove_child(const Widget* child) override;
  bool expands(Orientation o) const override;

protected:
  bool disconnect_extra(SignalId id) override { return erase_handler(notify_position_, id); }

private:
  void replace(WidgetPtr& slot, WidgetPtr child);
  int axis_size() const;

  Orientation orientation_;
  WidgetPtr start_;
  WidgetPtr end_;
  int position_ = 0;
  bool position_set_ = false;
  bool resize_start_ = true;
  bool resize_end_ = true;
  bool wide_handle_ = false;
  Handlers notify_position_;
  std::vector<SignalId> ticks_;
};

class TermOverlay : public TermWidget<OverlayWidget> {
public:
  explicit TermOverlay(TermContext& ctx) : TermWidget<OverlayWidget>(ctx) {}
  ~TermOverlay() override;

  void set_child(WidgetPtr child) override;
  WidgetPtr child() const override { return child_; }
  void add_overlay(WidgetPtr overlay) override;
  void remove_overlay(const Widget* overlay) override;
  int overlay_count() const override { return static_cast<int>(overlays_.size()); }
  void set_clip_overlay(const Widget* overlay, bool clip) override;
  void set_measure_overlay(const Widget* overlay, bool measure) override;

  void measure(int& width, int& height) const override;
  void layout(const Rect& area) override;
  void draw(ITerminal& term) const override;
  void children(std::vector<TermNode*>& out) const override;
  void remove_child(const Widget* child) override;
  bool expands(Orientation o) const override;

private:
  struct Layer {
    WidgetPtr widget;
    bool clip = true;
    bool measure = false;
  };
  WidgetPtr child_;
  std::vector<Layer> overlays_;
};

class TermLabel : public TermWidget<LabelWidget> {
public:
  TermLabel(TermContext& ctx, const std::string& text) : TermWidget<LabelWidget>(ctx), text_(text) {}
  void set_text(const std::string& text) override { text_ = text; }
  std::string text() const override { return text_; }
  void set_ellipsize(Ellipsize mode) override { ellipsize_ = mode; }
  void set_max_width_chars(int chars) override { max_chars_ = chars; }
  void set_xalign(float xalign) override { xalign_ = xalign; }

  void measure(int& width, int& height) const override;
  void draw(ITerminal& term) const override;

private:
  std::string text_;
  Ellipsize ellipsize_ = Ellipsize::None;
  int max_chars_ = -1;
  float xalign_ = 0.5f;
};

class TermButton : public TermWidget<ButtonWidget> {
public:
  explicit TermButton(TermContext& ctx) : TermWidget<ButtonWidget>(ctx) { can_focus_ = true; }
  void set_label(const std::string& label) override { label_ = label; }
  std::string label() const override { return label_; }
  void set_icon_name(const std::string& icon) override { icon_ = icon; }
  void set_focus_on_click(bool focus) override { focus_on_click_ = focus; }
  SignalId connect_clicked(std::function<void()> fn) override { return connect_to(clicked_, std::move(fn)); }

  void measure(int& width, int& height) const override;
  void draw(ITerminal& term) const override;
  bool press() override;

protected:
  bool disconnect_extra(SignalId id) override { return erase_handler(clicked_, id); }

private:
  std::string face() const;
  std::string label_;
  std::string icon_;
  bool focus_on_click_ = true;
  Handlers clicked_;
};

class TermImage : public TermWidget<ImageWidget> {
public:
  explicit TermImage(TermContext& ctx) : TermWidget<ImageWidget>(ctx) {}
  void set_from_icon_name(const std::string& icon) override { icon_ = icon; }
  std::string icon_name() const override { return icon_; }
  void set_pixel_size(int size) override { pixel_size_ = size; }
  void clear() override { icon_.clear(); }

  void measure(int& width, int& height) const override;
  void draw(ITerminal& term) const override;

private:
  std::string icon_;
  int pixel_size_ = 1;
};

class TermSpinner : public TermWidget<SpinnerWidget> {
public:
  explicit TermSpinner(TermContext& ctx) : TermWidget<SpinnerWidget>(ctx) {}
  void set_spinning(bool spinning) override { spinning_ = spinning; }
  bool spinning() const override { return spinning_; }

  void measure(int& width, int& height) const override { width = 1; height = 1; }
  void draw(ITerminal& term) const override;

private:
  bool spinning_ = false;
};

// Scrollable read-only line view hosting document content.
class TermTextView : public TermWidget<Widget> {
public:
  struct Highlight {
    int row;
    int col;
    int len;
  };

  explicit TermTextView(TermContext& ctx);

  void set_lines(std::vector<std::string> lines);
  const std::vector<std::string>& lines() const { return lines_; }
  int line_count() const { return static_cast<int>(lines_.size()); }
  void set_highlights(std::vector<Highlight> hits, int current);
  void clear_highlights();
  const std::vector<Highlight>& highlights() const { return hits_; }
  int current_highlight() const { return current_; }

  int top_line() const { return top_line_; }
  void scroll_to_line(int row);
  void scroll_by(int delta);

  void measure(int& width, int& height) const override { width = 1; height = 1; }
  void draw(ITerminal& term) const override;

private:
  int max_top() const;
  std::vector<std::string> lines_;
  std::vector<Highlight> hits_;
  int current_ = -1;
  int top_line_ = 0;
};

char icon_glyph(const std::string& icon);
std::string fit_text(const std::string& text, int width, Ellipsize mode);

void hit_path(TermNode* root, int row, int col, std::vector<TermNode*>& out);
bool dispatch_press(TermNode* root, int row, int col);
template <class T>
T* find_in_path(const std::vector<TermNode*>& path) {
  for (auto it = path.rbegin(); it != path.rend(); ++it) {
    if (auto* hit = dynamic_cast<T*>(*it)) return hit;
  }
  return nullptr;
}

class PointerTracker {
public:
  explicit PointerTracker(TermContext& ctx) : ctx_(ctx) {}
  void motion(TermNode* root, int row, int col);
  void leave_all();
  const std::vector<TermNode*>& hovered() const { return path_; }
private:
  TermContext& ctx_;
  std::vector<TermNode*> path_;
};

class TermWidgetFactory : public WidgetFactory {
public:
  std::shared_ptr<PanedWidget> new_paned(Orientation orientation) override;
  std::shared_ptr<BoxWidget> new_box(Orientation orientation, int spacing) override;
  std::shared_ptr<OverlayWidget> new_overlay() override;
  std::shared_ptr<LabelWidget> new_label(const std::string& text) override;
  std::shared_ptr<ButtonWidget> new_button() override;
  std::shared_ptr<ImageWidget> new_image() override;
  std::shared_ptr<SpinnerWidget> new_spinner() override;
  std::shared_ptr<TermTextView> new_text_view();

  TermContext& context() { return ctx_; }
  FrameClock& clock() { return ctx_.clock(); }

private:
  TermContext ctx_;
};
