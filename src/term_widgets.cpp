#include "term_widgets.hpp"
#include <algorithm>

// ---- FrameClock / TermContext ----

SignalId FrameClock::add(std::function<bool()> fn) {
  SignalId id = next_id_++;
  callbacks_.emplace(id, std::move(fn));
  return id;
}

void FrameClock::remove(SignalId id) { callbacks_.erase(id); }

void FrameClock::tick() {
  frame_++;
  std::vector<SignalId> ids;
  ids.reserve(callbacks_.size());
  for (const auto& kv : callbacks_) ids.push_back(kv.first);
  for (SignalId id : ids) {
    auto it = callbacks_.find(id);
    if (it == callbacks_.end()) continue;
    // the callback may remove itself while running
    auto fn = it->second;
    bool keep = fn ? fn() : false;
    if (!keep) callbacks_.erase(id);
  }
}

void TermContext::remove_live(const TermNode* n) {
  live_.erase(n);
  if (focus_ == n) focus_ = nullptr;
}

// ---- TermNode ----

TermNode::TermNode(TermContext& ctx) : ctx_(ctx) { ctx_.add_live(this); }

TermNode::~TermNode() { ctx_.remove_live(this); }

TermNode* term_node(const Widget* w) {
  return w ? dynamic_cast<TermNode*>(const_cast<Widget*>(w)) : nullptr;
}

bool TermNode::press() {
  bool handled = !pressed_.empty();
  fire(pressed_);
  return handled;
}

void TermNode::preferred_size(int& width, int& height) const {
  measure(width, height);
  if (req_w_ >= 0) width = req_w_;
  if (req_h_ >= 0) height = req_h_;
}

void TermNode::sync_mapped(bool parent_mapped) {
  bool now = parent_mapped && visible_;
  if (now && !mapped_) {
    mapped_ = true;
    fire(map_);
  } else if (!now) {
    mapped_ = false;
  }
  std::vector<TermNode*> kids;
  children(kids);
  for (TermNode* k : kids) k->sync_mapped(mapped_);
}

void TermNode::unmap() {
  mapped_ = false;
  std::vector<TermNode*> kids;
  children(kids);
  for (TermNode* k : kids) k->unmap();
}

void TermNode::enter() { fire(enter_); }
void TermNode::leave() { fire(leave_); }

SignalId TermNode::connect_to(Handlers& hs, std::function<void()> fn) {
  SignalId id = ctx_.next_signal_id();
  hs.emplace_back(id, std::move(fn));
  return id;
}

bool TermNode::erase_handler(Handlers& hs, SignalId id) {
  auto it = std::find_if(hs.begin(), hs.end(), [id](const auto& h){ return h.first == id; });
  if (it == hs.end()) return false;
  hs.erase(it);
  return true;
}

bool TermNode::disconnect_id(SignalId id) {
  return erase_handler(pressed_, id) || erase_handler(enter_, id) || erase_handler(leave_, id) ||
         erase_handler(map_, id) || disconnect_extra(id);
}

void TermNode::fire(Handlers hs) {
  for (auto& h : hs) if (h.second) h.second();
}

void TermNode::attach_child(const WidgetPtr& child) {
  if (child->parent()) child->unparent();
  if (TermNode* n = term_node(child.get())) n->set_node_parent(as_widget());
}

void TermNode::release_child(const WidgetPtr& child) {
  TermNode* n = term_node(child.get());
  if (!n) return;
  if (n->parent_ == as_widget()) n->parent_ = nullptr;
  n->unmap();
  n->alloc_ = Rect{};
}

void TermNode::layout_hidden(const WidgetPtr& child) {
  if (TermNode* n = term_node(child.get())) n->layout(Rect{alloc_.row, alloc_.col, 0, 0});
}

// ---- TermBox ----

TermBox::TermBox(TermContext& ctx, Orientation orientation, int spacing)
  : TermWidget<BoxWidget>(ctx), orientation_(orientation), spacing_(std::max(0, spacing)) {}

TermBox::~TermBox() {
  for (auto& c : children_) {
    if (TermNode* n = term_node(c.get())) if (n->node_parent() == this) n->set_node_parent(nullptr);
  }
}

void TermBox::append(WidgetPtr child) {
  if (!child) return;
  attach_child(child);
  children_.push_back(std::move(child));
}

void TermBox::prepend(WidgetPtr child) {
  if (!child) return;
  attach_child(child);
  children_.insert(children_.begin(), std::move(child));
}

void TermBox::insert_child_after(WidgetPtr child, const Widget* sibling) {
  if (!child) return;
  attach_child(child);
  if (!sibling) { children_.insert(children_.begin(), std::move(child)); return; }
  auto it = std::find_if(children_.begin(), children_.end(), [sibling](const WidgetPtr& w){ return w.get() == sibling; });
  if (it == children_.end()) children_.push_back(std::move(child));
  else children_.insert(it + 1, std::move(child));
}

void TermBox::remove(const Widget* child) {
  auto it = std::find_if(children_.begin(), children_.end(), [child](const WidgetPtr& w){ return w.get() == child; });
  if (it == children_.end()) return;
  WidgetPtr keep = *it;
  children_.erase(it);
  release_child(keep);
}

void TermBox::remove_all() {
  auto old = std::move(children_);
  children_.clear();
  for (auto& c : old) release_child(c);
}

void TermBox::children(std::vector<TermNode*>& out) const {
  for (const auto& c : children_) if (TermNode* n = term_node(c.get())) out.push_back(n);
}

bool TermBox::expands(Orientation o) const {
  if (TermNode::expands(o)) return true;
  for (const auto& c : children_) {
    TermNode* n = term_node(c.get());
    if (n && n->node_visible() && n->expands(o)) return true;
  }
  return false;
}

void TermBox::measure(int& width, int& height) const {
  int main = 0, cross = 0, shown = 0;
  for (const auto& c : children_) {
    TermNode* n = term_node(c.get());
    if (!n || !n->node_visible()) continue;
    int w = 0, h = 0;
    n->preferred_size(w, h);
    if (orientation_ == Orientation::Vertical) { main += h; cross = std::max(cross, w); }
    else { main += w; cross = std::max(cross, h); }
    shown++;
  }
  if (shown > 1) main += spacing_ * (shown - 1);
  if (orientation_ == Orientation::Vertical) { width = cross; height = main; }
  else { width = main; height = cross; }
}

static int aligned_offset(Align a, int avail, int size) {
  switch (a) {
    case Align::Center: return std::max(0, (avail - size) / 2);
    case Align::End: return std::max(0, avail - size);
    default: return 0;
  }
}

void TermBox::layout(const Rect& area) {
  alloc_ = area;
  bool vertical = orientation_ == Orientation::Vertical;
  std::vector<TermNode*> shown;
  for (const auto& c : children_) {
    TermNode* n = term_node(c.get());
    if (!n) continue;
    if (!n->node_visible()) { layout_hidden(c); continue; }
    shown.push_back(n);
  }
  if (shown.empty()) return;
  int avail_main = vertical ? area.height : area.width;
  int cross_size = vertical ? area.width : area.height;
  int n = static_cast<int>(shown.size());
  avail_main = std::max(0, avail_main - spacing_ * (n - 1));

  std::vector<int> natural(n), cross_nat(n), sizes(n);
  int total = 0, expanders = 0;
  for (int i = 0; i < n; ++i) {
    int w = 0, h = 0;
    shown[i]->preferred_size(w, h);
    natural[i] = vertical ? h : w;
    cross_nat[i] = vertical ? w : h;
    total += natural[i];
    if (shown[i]->expands(orientation_)) expanders++;
  }
  if (total <= avail_main) {
    int extra = avail_main - total;
    int share = expanders > 0 ? extra / expanders : 0;
    int rem = expanders > 0 ? extra % expanders : 0;
    for (int i = 0; i < n; ++i) {
      sizes[i] = natural[i];
      if (expanders > 0 && shown[i]->expands(orientation_)) {
        sizes[i] += share + (rem > 0 ? 1 : 0);
        if (rem > 0) rem--;
      }
    }
  } else {
    // not enough room: earlier children keep their size, later ones shrink
    int left = avail_main;
    for (int i = 0; i < n; ++i) {
      sizes[i] = std::min(natural[i], left);
      left -= sizes[i];
    }
  }
  int cursor = vertical ? area.row : area.col;
  for (int i = 0; i < n; ++i) {
    Align cross_align = vertical ? shown[i]->node_halign() : shown[i]->node_valign();
    int csize = cross_align == Align::Fill ? cross_size : std::min(cross_size, cross_nat[i]);
    int coff = aligned_offset(cross_align, cross_size, csize);
    Rect r;
    if (vertical) r = Rect{cursor, area.col + coff, sizes[i], csize};
    else r = Rect{area.row + coff, cursor, csize, sizes[i]};
    shown[i]->layout(r);
    cursor += sizes[i] + spacing_;
  }
}

void TermBox::draw(ITerminal& term) const {
  if (has_class("omnibox") || has_class("find-bar")) {
    // popups are opaque over the pane content
    std::string blank(std::max(0, alloc_.width), ' ');
    for (int r = 0; r < alloc_.height; ++r) term.draw_colored(alloc_.row + r, alloc_.col, blank, kPairBorder);
  }
  for (const auto& c : children_) {
    TermNode* n = term_node(c.get());
    if (n && n->node_visible()) n->draw(term);
  }
}

// ---- TermPaned ----

TermPaned::TermPaned(TermContext& ctx, Orientation orientation)
  : TermWidget<PanedWidget>(ctx), orientation_(orientation) {}

TermPaned::~TermPaned() {
  for (SignalId id : ticks_) ctx_.clock().remove(id);
  for (auto* slot : {&start_, &end_}) {
    if (TermNode* n = term_node(slot->get())) if (n->node_parent() == this) n->set_node_parent(nullptr);
  }
}

void TermPaned::replace(WidgetPtr& slot, WidgetPtr child) {
  if (child == slot) return;
  if (child) attach_child(child);
  WidgetPtr old = std::move(slot);
  slot = std::move(child);
  if (old) release_child(old);
}

void TermPaned::set_start_child(WidgetPtr child) { replace(start_, std::move(child)); }
void TermPaned::set_end_child(WidgetPtr child) { replace(end_, std::move(child)); }

void TermPaned::remove_child(const Widget* child) {
  if (start_.get() == child) replace(start_, nullptr);
  else if (end_.get() == child) replace(end_, nullptr);
}

void TermPaned::set_position(int position) {
  position_ = std::max(0, position);
  position_set_ = true;
}

void TermPaned::drag(int delta) {
  int size = axis_size();
  if (size <= 0) return;
  int base = position_set_ ? position_ : size / 2;
  position_ = std::clamp(base + delta, 0, std::max(0, size - 1));
  position_set_ = true;
  fire(notify_position_);
}

SignalId TermPaned::add_tick_callback(std::function<bool()> fn) {
  SignalId id = ctx_.clock().add(std::move(fn));
  ticks_.push_back(id);
  return id;
}

void TermPaned::remove_tick_callback(SignalId id) {
  ctx_.clock().remove(id);
  ticks_.erase(std::remove(ticks_.begin(), ticks_.end(), id), ticks_.end());
}

int TermPaned::axis_size() const {
  return orientation_ == Orientation::Horizontal ? alloc_.width : alloc_.height;
}

void TermPaned::children(std::vector<TermNode*>& out) const {
  if (TermNode* n = term_node(start_.get())) out.push_back(n);
  if (TermNode* n = term_node(end_.get())) out.push_back(n);
}

bool TermPaned::expands(Orientation o) const {
  if (TermNode::expands(o)) return true;
  for (const auto* slot : {&start_, &end_}) {
    TermNode* n = term_node(slot->get());
    if (n && n->node_visible() && n->expands(o)) return true;
  }
  return false;
}

void TermPaned::measure(int& width, int& height) const {
  int sw = 0, sh = 0, ew = 0, eh = 0;
  if (TermNode* n = term_node(start_.get())) n->preferred_size(sw, sh);
  if (TermNode* n = term_node(end_.get())) n->preferred_size(ew, eh);
  if (orientation_ == Orientation::Horizontal) { width = sw + ew + 1; height = std::max(sh, eh); }
  else { width = std::max(sw, ew); height = sh + eh + 1; }
}

Rect TermPaned::divider_rect() const {
  int size = axis_size();
  if (size <= 0) return Rect{alloc_.row, alloc_.col, 0, 0};
  int pos = position_set_ ? std::clamp(position_, 0, size - 1) : size / 2;
  if (orientation_ == Orientation::Horizontal) return Rect{alloc_.row, alloc_.col + pos, alloc_.height, 1};
  return Rect{alloc_.row + pos, alloc_.col, 1, alloc_.width};
}

void TermPaned::layout(const Rect& area) {
  alloc_ = area;
  TermNode* s = term_node(start_.get());
  TermNode* e = term_node(end_.get());
  bool s_shown = s && s->node_visible();
  bool e_shown = e && e->node_visible();
  if (s && !s_shown) layout_hidden(start_);
  if (e && !e_shown) layout_hidden(end_);
  if (!s_shown || !e_shown) {
    // a lone child takes the whole area, no divider
    if (s_shown) s->layout(area);
    if (e_shown) e->layout(area);
    return;
  }
  Rect d = divider_rect();
  if (orientation_ == Orientation::Horizontal) {
    int first = d.col - area.col;
    s->layout(Rect{area.row, area.col, area.height, first});
    e->layout(Rect{area.row, d.col + 1, area.height, std::max(0, area.width - first - 1)});
  } else {
    int first = d.row - area.row;
    s->layout(Rect{area.row, area.col, first, area.width});
    e->layout(Rect{d.row + 1, area.col, std::max(0, area.height - first - 1), area.width});
  }
}

void TermPaned::draw(ITerminal& term) const {
  TermNode* s = term_node(start_.get());
  TermNode* e = term_node(end_.get());
  if (s && s->node_visible()) s->draw(term);
  if (e && e->node_visible()) e->draw(term);
  if (!(s && s->node_visible() && e && e->node_visible())) return;
  Rect d = divider_rect();
  if (orientation_ == Orientation::Horizontal) {
    for (int r = 0; r < d.height; ++r) term.draw_colored(d.row + r, d.col, wide_handle_ ? "|" : ":", kPairBorder);
  } else {
    term.draw_colored(d.row, d.col, std::string(std::max(0, d.width), wide_handle_ ? '-' : '.'), kPairBorder);
  }
}

// ---- TermOverlay ----

TermOverlay::~TermOverlay() {
  if (TermNode* n = term_node(child_.get())) if (n->node_parent() == this) n->set_node_parent(nullptr);
  for (auto& l : overlays_) {
    if (TermNode* n = term_node(l.widget.get())) if (n->node_parent() == this) n->set_node_parent(nullptr);
  }
}

void TermOverlay::set_child(WidgetPtr child) {
  if (child == child_) return;
  if (child) attach_child(child);
  WidgetPtr old = std::move(child_);
  child_ = std::move(child);
  if (old) release_child(old);
}

void TermOverlay::add_overlay(WidgetPtr overlay) {
  if (!overlay) return;
  attach_child(overlay);
  overlays_.push_back(Layer{std::move(overlay), true, false});
}

void TermOverlay::remove_overlay(const Widget* overlay) {
  auto it = std::find_if(overlays_.begin(), overlays_.end(), [overlay](const Layer& l){ return l.widget.get() == overlay; });
  if (it == overlays_.end()) return;
  WidgetPtr keep = it->widget;
  overlays_.erase(it);
  release_child(keep);
}

void TermOverlay::remove_child(const Widget* child) {
  if (child_.get() == child) set_child(nullptr);
  else remove_overlay(child);
}

void TermOverlay::set_clip_overlay(const Widget* overlay, bool clip) {
  for (auto& l : overlays_) if (l.widget.get() == overlay) l.clip = clip;
}

void TermOverlay::set_measure_overlay(const Widget* overlay, bool measure) {
  for (auto& l : overlays_) if (l.widget.get() == overlay) l.measure = measure;
}

void TermOverlay::children(std::vector<TermNode*>& out) const {
  if (TermNode* n = term_node(child_.get())) out.push_back(n);
  for (const auto& l : overlays_) if (TermNode* n = term_node(l.widget.get())) out.push_back(n);
}

bool TermOverlay::expands(Orientation o) const {
  if (TermNode::expands(o)) return true;
  TermNode* n = term_node(child_.get());
  return n && n->node_visible() && n->expands(o);
}

void TermOverlay::measure(int& width, int& height) const {
  width = 0;
  height = 0;
  if (TermNode* n = term_node(child_.get())) if (n->node_visible()) n->preferred_size(width, height);
  for (const auto& l : overlays_) {
    TermNode* n = term_node(l.widget.get());
    if (!n || !l.measure || !n->node_visible()) continue;
    int w = 0, h = 0;
    n->preferred_size(w, h);
    width = std::max(width, w);
    height = std::max(height, h);
  }
}

void TermOverlay::layout(const Rect& area) {
  alloc_ = area;
  if (TermNode* n = term_node(child_.get())) {
    if (n->node_visible()) n->layout(area); else layout_hidden(child_);
  }
  for (const auto& l : overlays_) {
    TermNode* n = term_node(l.widget.get());
    if (!n) continue;
    if (!n->node_visible()) { layout_hidden(l.widget); continue; }
    int w = 0, h = 0;
    n->preferred_size(w, h);
    if (l.clip) { w = std::min(w, area.width); h = std::min(h, area.height); }
    if (n->node_halign() == Align::Fill) w = area.width;
    if (n->node_valign() == Align::Fill) h = area.height;
    int x = aligned_offset(n->node_halign(), area.width, w);
    int y = aligned_offset(n->node_valign(), area.height, h);
    n->layout(Rect{area.row + y, area.col + x, h, w});
  }
}

void TermOverlay::draw(ITerminal& term) const {
  if (TermNode* n = term_node(child_.get())) if (n->node_visible()) n->draw(term);
  for (const auto& l : overlays_) {
    TermNode* n = term_node(l.widget.get());
    if (n && n->node_visible()) n->draw(term);
  }
}

// ---- leaves ----

std::string fit_text(const std::string& text, int width, Ellipsize mode) {
  if (width <= 0) return std::string();
  int len = static_cast<int>(text.size());
  if (len <= width) return text;
  if (mode == Ellipsize::None || width <= 3) return text.substr(0, width);
  int keep = width - 3;
  switch (mode) {
    case Ellipsize::Start: return "..." + text.substr(len - keep);
    case Ellipsize::Middle: {
      int head = keep / 2 + keep % 2;
      int tail = keep / 2;
      return text.substr(0, head) + "..." + text.substr(len - tail);
    }
    default: return text.substr(0, keep) + "...";
  }
}

char icon_glyph(const std::string& icon) {
  if (icon.empty()) return ' ';
  if (icon == "window-close") return 'x';
  if (icon == "text-x-generic") return '=';
  if (icon == "folder") return '/';
  if (icon == "view-grid") return '#';
  if (icon == "system-search") return '?';
  if (icon == "web-browser") return '@';
  return '*';
}

void TermLabel::measure(int& width, int& height) const {
  width = static_cast<int>(text_.size());
  if (max_chars_ > 0) width = std::min(width, max_chars_);
  height = 1;
}

void TermLabel::draw(ITerminal& term) const {
  if (alloc_.width <= 0 || alloc_.height <= 0) return;
  std::string s = fit_text(text_, alloc_.width, ellipsize_);
  int pad = static_cast<int>((alloc_.width - static_cast<int>(s.size())) * std::clamp(xalign_, 0.0f, 1.0f));
  std::string line = std::string(pad, ' ') + s;
  line.resize(alloc_.width, ' ');
  bool hl = has_class("active") || has_class("selected") || has_class("pane-active");
  if (hl) term.draw_highlighted(alloc_.row, alloc_.col, line, 0, static_cast<int>(line.size()));
  else term.draw_text(alloc_.row, alloc_.col, line);
}

std::string TermButton::face() const {
  std::string inner = label_.empty() ? std::string(1, icon_glyph(icon_)) : label_;
  return "[" + inner + "]";
}

void TermButton::measure(int& width, int& height) const {
  width = static_cast<int>(face().size());
  height = 1;
}

void TermButton::draw(ITerminal& term) const {
  if (alloc_.width <= 0 || alloc_.height <= 0) return;
  term.draw_colored(alloc_.row, alloc_.col, fit_text(face(), alloc_.width, Ellipsize::None), kPairAccent);
}

bool TermButton::press() {
  bool handled = !pressed_.empty() || !clicked_.empty();
  if (focus_on_click_ && can_focus_) ctx_.set_focus(this);
  Handlers all = pressed_;
  all.insert(all.end(), clicked_.begin(), clicked_.end());
  fire(std::move(all));
  return handled;
}

void TermImage::measure(int& width, int& height) const {
  width = icon_.empty() ? 0 : std::max(1, pixel_size_ > 16 ? 2 : 1);
  height = icon_.empty() ? 0 : 1;
}

void TermImage::draw(ITerminal& term) const {
  if (icon_.empty() || alloc_.width <= 0 || alloc_.height <= 0) return;
  term.draw_colored(alloc_.row, alloc_.col, std::string(1, icon_glyph(icon_)), kPairAccent);
}

void TermSpinner::draw(ITerminal& term) const {
  if (!spinning_ || alloc_.width <= 0 || alloc_.height <= 0) return;
  static const char frames[] = {'|', '/', '-', '\\'};
  term.draw_colored(alloc_.row, alloc_.col, std::string(1, frames[ctx_.clock().frame() % 4]), kPairAccent);
}

TermTextView::TermTextView(TermContext& ctx) : TermWidget<Widget>(ctx) {
  hexpand_ = true;
  vexpand_ = true;
  can_focus_ = true;
}

void TermTextView::set_lines(std::vector<std::string> lines) {
  lines_ = std::move(lines);
  hits_.clear();
  current_ = -1;
  top_line_ = std::min(top_line_, max_top());
}

void TermTextView::set_highlights(std::vector<Highlight> hits, int current) {
  hits_ = std::move(hits);
  current_ = (current >= 0 && current < static_cast<int>(hits_.size())) ? current : -1;
  if (current_ >= 0) scroll_to_line(hits_[current_].row);
}

void TermTextView::clear_highlights() {
  hits_.clear();
  current_ = -1;
}

int TermTextView::max_top() const {
  int visible = std::max(1, alloc_.height);
  return std::max(0, static_cast<int>(lines_.size()) - visible);
}

void TermTextView::scroll_to_line(int row) {
  int visible = std::max(1, alloc_.height);
  if (row < top_line_) top_line_ = row;
  else if (row >= top_line_ + visible) top_line_ = row - visible + 1;
  top_line_ = std::clamp(top_line_, 0, max_top());
}

void TermTextView::scroll_by(int delta) {
  top_line_ = std::clamp(top_line_ + delta, 0, max_top());
}

void TermTextView::draw(ITerminal& term) const {
  int w = alloc_.width;
  if (w <= 0) return;
  for (int i = 0; i < alloc_.height; ++i) {
    int idx = top_line_ + i;
    if (idx >= static_cast<int>(lines_.size())) break;
    std::string vis = lines_[idx].substr(0, std::min<size_t>(lines_[idx].size(), static_cast<size_t>(w)));
    int row = alloc_.row + i;
    term.draw_text(row, alloc_.col, vis);
    for (int h = 0; h < static_cast<int>(hits_.size()); ++h) {
      const Highlight& hit = hits_[h];
      if (hit.row != idx || hit.col >= static_cast<int>(vis.size())) continue;
      int len = std::min(hit.len, static_cast<int>(vis.size()) - hit.col);
      std::string seg = vis.substr(hit.col, len);
      if (h == current_) term.draw_highlighted(row, alloc_.col + hit.col, seg, 0, len);
      else term.draw_colored(row, alloc_.col + hit.col, seg, kPairAccent);
    }
  }
}

// ---- pointer ----

void hit_path(TermNode* root, int row, int col, std::vector<TermNode*>& out) {
  out.clear();
  TermNode* cur = root;
  while (cur && cur->node_visible() && cur->node_targetable() && rect_contains(cur->alloc(), row, col)) {
    out.push_back(cur);
    std::vector<TermNode*> kids;
    cur->children(kids);
    TermNode* next = nullptr;
    // later children (overlays) sit on top
    for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
      TermNode* k = *it;
      if (k->node_visible() && k->node_targetable() && rect_contains(k->alloc(), row, col)) { next = k; break; }
    }
    cur = next;
  }
}

bool dispatch_press(TermNode* root, int row, int col) {
  std::vector<TermNode*> path;
  hit_path(root, row, col, path);
  for (auto it = path.rbegin(); it != path.rend(); ++it) {
    if ((*it)->press()) return true;
  }
  return false;
}

void PointerTracker::motion(TermNode* root, int row, int col) {
  std::vector<TermNode*> next;
  hit_path(root, row, col, next);
  auto contains = [](const std::vector<TermNode*>& v, TermNode* n){ return std::find(v.begin(), v.end(), n) != v.end(); };
  std::vector<TermNode*> prev = std::move(path_);
  path_ = next;
  for (auto it = prev.rbegin(); it != prev.rend(); ++it) {
    if (!contains(next, *it) && ctx_.is_live(*it)) (*it)->leave();
  }
  for (TermNode* n : next) {
    if (!contains(prev, n) && ctx_.is_live(n)) n->enter();
  }
}

void PointerTracker::leave_all() {
  std::vector<TermNode*> prev = std::move(path_);
  path_.clear();
  for (auto it = prev.rbegin(); it != prev.rend(); ++it) {
    if (ctx_.is_live(*it)) (*it)->leave();
  }
}

// ---- factory ----

std::shared_ptr<PanedWidget> TermWidgetFactory::new_paned(Orientation orientation) {
  return std::make_shared<TermPaned>(ctx_, orientation);
}

std::shared_ptr<BoxWidget> TermWidgetFactory::new_box(Orientation orientation, int spacing) {
  return std::make_shared<TermBox>(ctx_, orientation, spacing);
}

std::shared_ptr<OverlayWidget> TermWidgetFactory::new_overlay() {
  return std::make_shared<TermOverlay>(ctx_);
}

std::shared_ptr<LabelWidget> TermWidgetFactory::new_label(const std::string& text) {
  return std::make_shared<TermLabel>(ctx_, text);
}

std::shared_ptr<ButtonWidget> TermWidgetFactory::new_button() {
  return std::make_shared<TermButton>(ctx_);
}

std::shared_ptr<ImageWidget> TermWidgetFactory::new_image() {
  return std::make_shared<TermImage>(ctx_);
}

std::shared_ptr<SpinnerWidget> TermWidgetFactory::new_spinner() {
  return std::make_shared<TermSpinner>(ctx_);
}

std::shared_ptr<TermTextView> TermWidgetFactory::new_text_view() {
  return std::make_shared<TermTextView>(ctx_);
}
