#include <ncurses.h>
#include "app.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>

static constexpr int CTRL_d = 'D'-64;
static constexpr int CTRL_u = 'U'-64;
static constexpr int CTRL_l = 'L'-64;
static constexpr int CTRL_n = 'N'-64;
static constexpr int CTRL_p = 'P'-64;
static constexpr int ESC = 27;

static bool is_backspace(int ch) { return ch == KEY_BACKSPACE || ch == 127 || ch == 8; }
static bool is_enter(int ch) { return ch == '\n' || ch == '\r' || ch == KEY_ENTER; }
static bool is_printable(int ch) { return ch >= 32 && ch <= 126; }

static std::string title_for(const std::string& uri) {
  if (uri.empty()) return "welcome";
  std::filesystem::path p(uri);
  std::string name = p.filename().string();
  if (name.empty()) name = p.parent_path().filename().string() + "/";
  return name.empty() || name == "/" ? uri : name;
}

App::App(ITerminal& term, MainLoop& loop, const std::vector<std::string>& paths,
         std::filesystem::path base_dir)
  : loop_(loop), term_(term), base_dir_(std::move(base_dir)),
    content_(factory_, &log_),
    suggestions_(std::make_shared<PathSuggestionSource>(base_dir_)),
    view_(factory_, loop_, settings_),
    pointer_(factory_.context()) {
  ws_.id = "workspace-1";
  view_.set_status_log(&log_);
  view_.set_content_factory(&content_);
  view_.set_suggestion_source(suggestions_, &worker_);
  view_.set_find_controller_provider([this](const std::string& id){ return content_.find_controller(id); });
  view_.set_on_pane_focused([this](const std::string&){ input_.reset(); });
  view_.set_on_split_ratio_dragged([this](const std::string& id, double r){ on_ratio_dragged(id, r); });
  view_.set_on_close_pane([this](const std::string& id){ close_pane_id(id, false); });
  view_.set_on_navigate([this](const std::string& pane, const std::string& target){ on_navigate(pane, target); });
  register_commands();

  if (paths.empty()) {
    auto pane = new_pane("");
    ws_.active_pane_id = pane->id;
    ws_.root = make_leaf(std::move(pane));
  } else {
    for (const auto& p : paths) {
      auto pane = new_pane(resolve_uri(p));
      suggestions_->add_recent(pane->uri);
      if (!ws_.root) {
        ws_.active_pane_id = pane->id;
        ws_.root = make_leaf(std::move(pane));
      } else {
        split_pane(ws_, ws_.active_pane_id, std::move(pane), SplitDir::Horizontal, settings_.default_split_ratio);
      }
    }
  }
  view_.set_workspace(&ws_);
}

App::~App() {
  worker_.wait_idle();
}

std::shared_ptr<Pane> App::new_pane(const std::string& uri) {
  auto pane = std::make_shared<Pane>();
  pane->id = "pane-" + std::to_string(next_pane_++);
  pane->uri = uri;
  pane->title = title_for(uri);
  return pane;
}

std::string App::resolve_uri(const std::string& target) const {
  if (target.empty() || target.find("://") != std::string::npos) return target;
  std::filesystem::path p(target);
  if (target[0] == '~') {
    const char* home = std::getenv("HOME");
    if (home) p = std::filesystem::path(home) / target.substr(target.size() > 1 && target[1] == '/' ? 2 : 1);
  }
  if (p.is_relative()) p = base_dir_ / p;
  return p.lexically_normal().string();
}

void App::load_rc(const std::filesystem::path& path) {
  std::vector<std::string> cmds;
  std::string msg;
  if (!read_rc_commands(path, cmds, msg)) { log_.error(msg); return; }
  for (const auto& c : cmds) execute(c);
}

void App::run() {
  while (!should_quit_) {
    frame();
    int ch = getch();
    if (ch == ERR || ch == KEY_RESIZE) continue;
    if (ch == KEY_MOUSE) {
      MEVENT me;
      if (getmouse(&me) != OK || !settings_.enable_mouse) continue;
      PointerEvent ev;
      ev.row = me.y;
      ev.col = me.x;
      #ifdef BUTTON4_PRESSED
      if (me.bstate & BUTTON4_PRESSED) { ev.kind = PointerEvent::Kind::WheelUp; handle_pointer(ev); continue; }
      #endif
      #ifdef BUTTON5_PRESSED
      if (me.bstate & BUTTON5_PRESSED) { ev.kind = PointerEvent::Kind::WheelDown; handle_pointer(ev); continue; }
      #endif
      ev.kind = PointerEvent::Kind::Motion;
      handle_pointer(ev);
      if (me.bstate & (BUTTON1_PRESSED | BUTTON1_CLICKED)) {
        ev.kind = PointerEvent::Kind::Press;
        handle_pointer(ev);
      }
      continue;
    }
    handle_input(ch);
  }
}

void App::frame() {
  loop_.run_pending();
  factory_.clock().tick();
  renderer_.render(term_, view_.widget(), status());
}

StatusInfo App::status() const {
  StatusInfo st;
  switch (mode_) {
    case AppMode::Tile: st.mode = "TILE"; break;
    case AppMode::Command: st.mode = "COMMAND"; break;
    case AppMode::Omnibox: st.mode = "OMNIBOX"; break;
    case AppMode::Find: st.mode = "FIND"; break;
  }
  st.command_mode = mode_ == AppMode::Command;
  st.cmdline = cmdline_;
  std::string active = ws_.active_pane_id;
  if (PaneNode* leaf = find_leaf(ws_.root.get(), active)) {
    st.location = leaf->pane->uri.empty() ? "[" + leaf->pane->title + "]" : leaf->pane->uri;
  }
  if (ws_.root) {
    std::vector<const PaneNode*> leaves;
    collect_leaves(*ws_.root, leaves);
    for (size_t i = 0; i < leaves.size(); ++i) {
      if (leaves[i]->pane->id == active) { st.position = std::to_string(i + 1) + "/" + std::to_string(leaves.size()); break; }
    }
  }
  if (FindBar* fb = view_.find_bar()) {
    if (fb->is_visible() && !fb->query().empty()) st.position += "  [" + fb->counter_text() + "]";
  }
  st.message = log_.current();
  return st;
}

TermNode* App::root_node() const {
  return term_node(view_.widget().get());
}

void App::handle_pointer(const PointerEvent& ev) {
  TermNode* root = root_node();
  if (!root) return;
  switch (ev.kind) {
    case PointerEvent::Kind::Motion:
      pointer_.motion(root, ev.row, ev.col);
      break;
    case PointerEvent::Kind::Press:
      dispatch_press(root, ev.row, ev.col);
      break;
    case PointerEvent::Kind::WheelUp:
    case PointerEvent::Kind::WheelDown: {
      std::vector<TermNode*> path;
      hit_path(root, ev.row, ev.col, path);
      if (auto* tv = find_in_path<TermTextView>(path)) {
        int step = std::max(1, tv->allocated_height() / 6);
        tv->scroll_by(ev.kind == PointerEvent::Kind::WheelUp ? -step : step);
      }
      break;
    }
  }
}

void App::handle_input(int ch) {
  switch (mode_) {
    case AppMode::Command: handle_command_input(ch); return;
    case AppMode::Omnibox: handle_omnibox_input(ch); return;
    case AppMode::Find: handle_find_input(ch); return;
    case AppMode::Tile: break;
  }
  handle_tile_input(ch);
}

void App::handle_tile_input(int ch) {
  WindowCmd cmd = WindowCmd::None;
  if (!input_.window_pending() && (ch != '0' || input_.has_count()) && input_.consume_digit(ch)) return;
  if (input_.consume_window(ch, cmd)) {
    if (input_.window_pending()) return;
    int count = input_.has_count() ? static_cast<int>(input_.take_count()) : 1;
    switch (cmd) {
      case WindowCmd::FocusLeft: focus_direction('h'); break;
      case WindowCmd::FocusDown: focus_direction('j'); break;
      case WindowCmd::FocusUp: focus_direction('k'); break;
      case WindowCmd::FocusRight: focus_direction('l'); break;
      case WindowCmd::FocusNext: focus_next_pane(); break;
      case WindowCmd::SplitVertical: split_active(SplitDir::Horizontal, ""); break;
      case WindowCmd::SplitHorizontal: split_active(SplitDir::Vertical, ""); break;
      case WindowCmd::Stack: stack_active(""); break;
      case WindowCmd::Close: close_pane_id(ws_.active_pane_id, false); break;
      case WindowCmd::StackNext: stack_navigate(true); break;
      case WindowCmd::StackPrevious: stack_navigate(false); break;
      case WindowCmd::ShrinkWidth: drag_divider('<', count); break;
      case WindowCmd::GrowWidth: drag_divider('>', count); break;
      case WindowCmd::ShrinkHeight: drag_divider('-', count); break;
      case WindowCmd::GrowHeight: drag_divider('+', count); break;
      case WindowCmd::MoveLeft: move_active('h'); break;
      case WindowCmd::MoveDown: move_active('j'); break;
      case WindowCmd::MoveUp: move_active('k'); break;
      case WindowCmd::MoveRight: move_active('l'); break;
      case WindowCmd::None: break;
    }
    return;
  }
  int count = input_.has_count() ? static_cast<int>(input_.take_count()) : 1;
  auto tv = active_text_view();
  switch (ch) {
    case ':':
      mode_ = AppMode::Command;
      cmdline_.clear();
      return;
    case 'o':
    case CTRL_l:
      if (view_.show_omnibox("")) mode_ = AppMode::Omnibox;
      return;
    case 'O': {
      PaneNode* leaf = find_leaf(ws_.root.get(), ws_.active_pane_id);
      if (view_.show_omnibox(leaf ? leaf->pane->uri : std::string())) mode_ = AppMode::Omnibox;
      return;
    }
    case '/':
      if (view_.show_find_bar()) {
        if (FindBar* fb = view_.find_bar()) fb->set_query("");
        mode_ = AppMode::Find;
      }
      return;
    case 'n': view_.find_next(); return;
    case 'N': view_.find_previous(); return;
    case ESC:
      view_.hide_omnibox();
      view_.hide_find_bar();
      log_.clear_current();
      return;
    case 'j': case KEY_DOWN: if (tv) tv->scroll_by(count); return;
    case 'k': case KEY_UP: if (tv) tv->scroll_by(-count); return;
    case CTRL_d: if (tv) tv->scroll_by(std::max(1, tv->allocated_height() / 2)); return;
    case CTRL_u: if (tv) tv->scroll_by(-std::max(1, tv->allocated_height() / 2)); return;
    case 'g': if (tv) tv->scroll_to_line(0); return;
    case 'G': if (tv) tv->scroll_to_line(std::max(0, tv->line_count() - 1)); return;
    default: break;
  }
}

void App::handle_command_input(int ch) {
  if (ch == ESC) { mode_ = AppMode::Tile; return; }
  if (is_backspace(ch)) {
    if (cmdline_.empty()) { mode_ = AppMode::Tile; return; }
    cmdline_.pop_back();
    return;
  }
  if (is_enter(ch)) { mode_ = AppMode::Tile; execute_cmdline(); return; }
  if (is_printable(ch)) cmdline_.push_back(static_cast<char>(ch));
}

void App::handle_omnibox_input(int ch) {
  auto box = view_.omnibox();
  if (!box || !box->is_visible()) { mode_ = AppMode::Tile; handle_tile_input(ch); return; }
  if (ch == ESC) { view_.hide_omnibox(); mode_ = AppMode::Tile; return; }
  if (is_enter(ch)) {
    if (box->activate()) mode_ = AppMode::Tile;
    return;
  }
  if (ch == KEY_DOWN || ch == '\t' || ch == CTRL_n) { box->select_next(); return; }
  if (ch == KEY_UP || ch == KEY_BTAB || ch == CTRL_p) { box->select_previous(); return; }
  if (is_backspace(ch)) { box->backspace(); return; }
  if (is_printable(ch)) box->append_char(static_cast<char>(ch));
}

void App::handle_find_input(int ch) {
  FindBar* fb = view_.find_bar();
  if (!fb || !fb->is_visible()) { mode_ = AppMode::Tile; handle_tile_input(ch); return; }
  if (ch == ESC) { view_.hide_find_bar(); mode_ = AppMode::Tile; return; }
  if (is_enter(ch)) { view_.find_next(); mode_ = AppMode::Tile; return; }
  if (ch == KEY_DOWN || ch == CTRL_n) { view_.find_next(); return; }
  if (ch == KEY_UP || ch == CTRL_p) { view_.find_previous(); return; }
  if (is_backspace(ch)) { fb->backspace(); return; }
  if (is_printable(ch)) fb->append_char(static_cast<char>(ch));
}

void App::execute_cmdline() {
  std::string line = cmdline_;
  cmdline_.clear();
  execute(line);
}

bool App::execute(const std::string& cmdline) {
  if (cmdline.empty()) return true;
  if (cmdline[0] == '/') {
    if (!view_.show_find_bar()) return false;
    if (FindBar* fb = view_.find_bar()) {
      fb->set_query(cmdline.substr(1));
      view_.find_next();
    }
    return true;
  }
  std::string msg;
  if (!registry_.execute_line(cmdline, msg)) { log_.error(msg); return false; }
  return true;
}

void App::apply_rebuild() {
  // the layout moves under the pointer; don't let hover steal focus
  view_.suppress_hover_for_keyboard();
  view_.rebuild();
  pointer_.leave_all();
}

void App::keyboard_focus(const std::string& pane_id) {
  view_.suppress_hover_for_keyboard();
  view_.cancel_all_pending_hovers();
  if (!view_.focus_pane(pane_id)) log_.error("cannot focus " + pane_id);
}

bool App::split_active(SplitDir dir, const std::string& uri) {
  PaneNode* leaf = find_leaf(ws_.root.get(), ws_.active_pane_id);
  if (!leaf) { log_.error("no active pane"); return false; }
  auto pane = new_pane(uri.empty() ? leaf->pane->uri : resolve_uri(uri));
  std::string id = pane->id;
  if (!split_pane(ws_, ws_.active_pane_id, std::move(pane), dir, settings_.default_split_ratio)) {
    log_.error("cannot split " + ws_.active_pane_id);
    return false;
  }
  apply_rebuild();
  log_.info("split: " + id);
  return true;
}

bool App::stack_active(const std::string& uri) {
  PaneNode* leaf = find_leaf(ws_.root.get(), ws_.active_pane_id);
  if (!leaf) { log_.error("no active pane"); return false; }
  auto pane = new_pane(uri.empty() ? leaf->pane->uri : resolve_uri(uri));
  std::string id = pane->id;
  if (!stack_pane(ws_, ws_.active_pane_id, std::move(pane))) {
    log_.error("cannot stack on " + ws_.active_pane_id);
    return false;
  }
  ws_.active_pane_id = id;
  apply_rebuild();
  log_.info("stacked: " + id);
  return true;
}

bool App::close_pane_id(const std::string& pane_id, bool quit_if_last) {
  if (!ws_.root) return false;
  std::vector<const PaneNode*> leaves;
  collect_leaves(*ws_.root, leaves);
  if (leaves.size() <= 1) {
    if (quit_if_last) { should_quit_ = true; return true; }
    log_.error("cannot close last pane");
    return false;
  }
  std::string msg;
  if (!close_pane(ws_, pane_id, msg)) { log_.error(msg); return false; }
  apply_rebuild();
  content_.release(pane_id);
  log_.info("closed " + pane_id);
  return true;
}

std::string App::pane_in_direction(char dir) const {
  // center-distance scoring over the currently visible pane rectangles
  std::string active = ws_.active_pane_id;
  WidgetPtr cur = view_.pane_widget(active);
  if (!cur) return std::string();
  Rect cur_rect = cur->allocation();
  auto center = [](const Rect& r){ return std::pair<int,int>{r.row + r.height/2, r.col + r.width/2}; };
  auto [cr, cc] = center(cur_rect);
  std::string best;
  int best_score = std::numeric_limits<int>::max();
  for (const auto& id : view_.pane_ids()) {
    if (id == active) continue;
    WidgetPtr w = view_.pane_widget(id);
    if (!w || !w->is_mapped()) continue;
    Rect r = w->allocation();
    if (r.width <= 0 || r.height <= 0) continue;
    auto [rr, rc] = center(r);
    int dr = rr - cr;
    int dc = rc - cc;
    bool ok = false;
    switch (dir) {
      case 'h': ok = (dc < 0); break;
      case 'l': ok = (dc > 0); break;
      case 'k': ok = (dr < 0); break;
      case 'j': ok = (dr > 0); break;
      default: break;
    }
    if (!ok) continue;
    int score = dr*dr + dc*dc;
    if (score < best_score) { best_score = score; best = id; }
  }
  return best;
}

void App::focus_direction(char dir) {
  std::string target = pane_in_direction(dir);
  if (!target.empty()) keyboard_focus(target);
  else focus_next_pane();
}

void App::focus_next_pane() {
  if (!ws_.root) return;
  std::vector<const PaneNode*> leaves;
  collect_leaves(*ws_.root, leaves);
  if (leaves.size() <= 1) return;
  size_t idx = 0;
  for (size_t i = 0; i < leaves.size(); ++i) if (leaves[i]->pane->id == ws_.active_pane_id) { idx = i; break; }
  keyboard_focus(leaves[(idx + 1) % leaves.size()]->pane->id);
}

void App::stack_navigate(bool forward) {
  auto stack = view_.renderer().stacked_view_for_pane(ws_.active_pane_id);
  if (!stack) { log_.error("pane is not stacked"); return; }
  LayoutError err = forward ? stack->navigate_next() : stack->navigate_previous();
  if (err != LayoutError::None) { log_.error(layout_error_message(err)); return; }
  keyboard_focus(stack->pane_id_at(stack->active_index()));
}

bool App::move_active(char dir) {
  std::string active = ws_.active_pane_id;
  std::string target = pane_in_direction(dir);
  if (target.empty()) { log_.error(std::string("no pane in direction ") + dir); return false; }
  SplitDir sd = (dir == 'h' || dir == 'l') ? SplitDir::Horizontal : SplitDir::Vertical;
  std::string msg;
  if (!move_pane(ws_, active, target, sd, settings_.default_split_ratio, msg)) { log_.error(msg); return false; }
  if (dir == 'h' || dir == 'k') {
    // move_pane puts the pane after the target; left/up wants it before
    PaneNode* leaf = find_leaf(ws_.root.get(), active);
    PaneNode* parent = leaf ? find_parent(ws_.root.get(), leaf) : nullptr;
    if (parent && parent->is_split()) {
      std::swap(parent->children[0], parent->children[1]);
      parent->split_ratio = 1.0 - parent->split_ratio;
    }
  }
  ws_.active_pane_id = active;
  apply_rebuild();
  log_.info(msg);
  return true;
}

PaneNode* App::enclosing_split(const std::string& pane_id, SplitDir dir, bool& in_start) {
  PaneNode* root = ws_.root.get();
  PaneNode* child = find_leaf(root, pane_id);
  if (!child) return nullptr;
  for (PaneNode* parent = find_parent(root, child); parent; parent = find_parent(root, parent)) {
    if (parent->is_split() && (dir == SplitDir::None || parent->split_dir == dir)) {
      in_start = parent->left() == child;
      return parent;
    }
    child = parent;
  }
  return nullptr;
}

bool App::drag_divider(char key, int steps) {
  SplitDir want = (key == '<' || key == '>') ? SplitDir::Horizontal : SplitDir::Vertical;
  bool in_start = true;
  PaneNode* split = enclosing_split(ws_.active_pane_id, want, in_start);
  if (!split) { log_.error("no divider to move"); return false; }
  auto sv = view_.renderer().split_view(split->id);
  auto* paned = sv ? dynamic_cast<TermPaned*>(sv->paned().get()) : nullptr;
  if (!paned) { log_.error("divider " + split->id + " is not rendered"); return false; }
  bool grow = key == '>' || key == '+';
  paned->drag(steps * (grow == in_start ? 1 : -1));
  return true;
}

bool App::set_active_ratio(double ratio) {
  bool in_start = true;
  PaneNode* split = enclosing_split(ws_.active_pane_id, SplitDir::None, in_start);
  if (!split) { log_.error("active pane is not in a split"); return false; }
  split->split_ratio = std::clamp(ratio, 0.0, 1.0);
  LayoutError err = view_.renderer().update_split_ratio(split->id, ratio);
  if (err != LayoutError::None) { log_.error(layout_error_message(err)); return false; }
  return true;
}

void App::on_ratio_dragged(const std::string& node_id, double ratio) {
  PaneNode* node = find_node(ws_.root.get(), node_id);
  if (!node || !node->is_split()) return;
  node->split_ratio = ratio;
}

bool App::open_in_active(const std::string& uri) {
  if (ws_.active_pane_id.empty()) { log_.error("no active pane"); return false; }
  on_navigate(ws_.active_pane_id, uri);
  return true;
}

void App::on_navigate(const std::string& pane_id, const std::string& target) {
  PaneNode* leaf = find_leaf(ws_.root.get(), pane_id);
  if (!leaf) { log_.error("pane not found: " + pane_id); return; }
  std::string uri = resolve_uri(target);
  leaf->pane->uri = uri;
  leaf->pane->title = title_for(uri);
  if (!content_.reload(*leaf->pane)) view_.rebuild();
  suggestions_->add_recent(uri);
  if (auto pv = view_.pane_view(pane_id)) pv->set_title(leaf->pane->title);
  if (auto stack = view_.renderer().stacked_view_for_pane(pane_id)) {
    stack->update_title(stack->find_pane_index(pane_id), leaf->pane->title);
  }
  log_.info("opened " + uri);
}

std::shared_ptr<TermTextView> App::active_text_view() const {
  return content_.text_view(ws_.active_pane_id);
}
