#include "headless_terminal.hpp"
#include "renderer.hpp"
#include "term_widgets.hpp"
#include <cassert>
#include <string>
#include <vector>

static TermNode* node(const WidgetPtr& w) { return term_node(w.get()); }

static void test_box_layout() {
  TermWidgetFactory f;
  auto box = f.new_box(Orientation::Vertical, 0);
  auto label = f.new_label("title");
  auto view = f.new_text_view();
  box->append(label);
  box->append(view);
  assert(box->child_count() == 2);
  assert(label->parent() == box.get());

  node(box)->layout(Rect{0, 0, 10, 20});
  assert(label->allocation().row == 0);
  assert(label->allocated_height() == 1);
  assert(label->allocated_width() == 20);
  assert(view->allocation().row == 1);
  assert(view->allocated_height() == 9);

  // hidden children get no space
  label->hide();
  node(box)->layout(Rect{0, 0, 10, 20});
  assert(label->allocated_height() == 0);
  assert(view->allocated_height() == 10);
  label->show();

  auto row = f.new_box(Orientation::Horizontal, 1);
  auto a = f.new_label("aaaa");
  auto b = f.new_label("bb");
  b->set_hexpand(true);
  row->append(a);
  row->append(b);
  int w = 0, h = 0;
  node(row)->preferred_size(w, h);
  assert(w == 7 && h == 1);
  node(row)->layout(Rect{3, 2, 1, 20});
  assert(a->allocation().col == 2 && a->allocated_width() == 4);
  assert(b->allocation().col == 7 && b->allocated_width() == 15);

  // too narrow: later children shrink first
  node(row)->layout(Rect{0, 0, 1, 5});
  assert(a->allocated_width() == 4);
  assert(b->allocated_width() == 0);
}

static void test_ownership() {
  TermWidgetFactory f;
  auto label = f.new_label("x");
  {
    auto box = f.new_box(Orientation::Vertical, 0);
    box->append(label);
    label->unparent();
    assert(box->child_count() == 0);
    assert(label->parent() == nullptr);
    box->append(label);
  }
  // a destroyed container leaves no dangling back pointer
  assert(label->parent() == nullptr);

  auto first = f.new_box(Orientation::Vertical, 0);
  auto second = f.new_box(Orientation::Vertical, 0);
  first->append(label);
  second->append(label);
  assert(first->child_count() == 0);
  assert(label->parent() == second.get());

  auto paned = f.new_paned(Orientation::Horizontal);
  paned->set_start_child(label);
  assert(second->child_count() == 0);
  assert(paned->start_child() == label);
  label->unparent();
  assert(paned->start_child() == nullptr);
}

static void test_paned() {
  TermWidgetFactory f;
  auto paned = f.new_paned(Orientation::Horizontal);
  auto* tp = static_cast<TermPaned*>(paned.get());
  auto left = f.new_label("L");
  auto right = f.new_label("R");
  paned->set_start_child(left);
  paned->set_end_child(right);
  paned->set_wide_handle(true);

  node(paned)->layout(Rect{0, 0, 4, 21});
  assert(left->allocated_width() == 10);
  assert(right->allocation().col == 11);
  assert(right->allocated_width() == 10);

  int notified = 0;
  SignalId id = paned->connect_notify_position([&]{ notified++; });
  paned->set_position(5);
  assert(notified == 0);
  node(paned)->layout(Rect{0, 0, 4, 21});
  assert(left->allocated_width() == 5);

  tp->drag(3);
  assert(paned->position() == 8);
  assert(notified == 1);
  tp->drag(100);
  assert(paned->position() == 20);
  paned->disconnect(id);
  tp->drag(-1);
  assert(notified == 2);

  HeadlessTerminal term(4, 21);
  paned->set_position(10);
  node(paned)->layout(Rect{0, 0, 4, 21});
  node(paned)->draw(term);
  assert(term.at(0, 10) == '|');
  assert(term.color(3, 10) == kPairBorder);

  // a lone child takes the whole area
  right->hide();
  node(paned)->layout(Rect{0, 0, 4, 21});
  assert(left->allocated_width() == 21);
}

static void test_map_and_ticks() {
  TermWidgetFactory f;
  auto paned = f.new_paned(Orientation::Vertical);
  int mapped = 0;
  paned->connect_map([&]{ mapped++; });
  paned->hide();
  Renderer::layout_frame(paned, Rect{0, 0, 10, 10});
  assert(mapped == 0);
  assert(!paned->is_mapped());
  paned->show();
  Renderer::layout_frame(paned, Rect{0, 0, 10, 10});
  assert(mapped == 1);
  Renderer::layout_frame(paned, Rect{0, 0, 10, 10});
  assert(mapped == 1);
  paned->hide();
  paned->show();
  Renderer::layout_frame(paned, Rect{0, 0, 10, 10});
  assert(mapped == 2);

  int ticks = 0;
  paned->add_tick_callback([&]{ return ++ticks < 3; });
  SignalId removed = paned->add_tick_callback([&]{ ticks += 100; return true; });
  paned->remove_tick_callback(removed);
  for (int i = 0; i < 5; ++i) f.clock().tick();
  assert(ticks == 3);
  assert(f.clock().size() == 0);
  assert(f.clock().frame() == 5);

  // ticks registered by a destroyed paned never run
  paned->add_tick_callback([&]{ ticks++; return true; });
  paned.reset();
  f.clock().tick();
  assert(ticks == 3);
}

static void test_overlay() {
  TermWidgetFactory f;
  auto overlay = f.new_overlay();
  auto body = f.new_box(Orientation::Vertical, 0);
  auto pop = f.new_label("pop");
  pop->set_halign(Align::Center);
  pop->set_valign(Align::Start);
  overlay->set_child(body);
  overlay->add_overlay(pop);
  assert(overlay->overlay_count() == 1);
  node(overlay)->layout(Rect{2, 0, 6, 21});
  assert(body->allocated_height() == 6);
  assert(pop->allocation().row == 2);
  assert(pop->allocation().col == 9);
  assert(pop->allocated_width() == 3);

  overlay->remove_overlay(pop.get());
  assert(overlay->overlay_count() == 0);
  assert(pop->parent() == nullptr);
}

static void test_text() {
  assert(fit_text("abcdefghij", 6, Ellipsize::End) == "abc...");
  assert(fit_text("abcdefghij", 6, Ellipsize::Start) == "...hij");
  assert(fit_text("abcdefghij", 6, Ellipsize::Middle) == "ab...j");
  assert(fit_text("abcdefghij", 6, Ellipsize::None) == "abcdef");
  assert(fit_text("abc", 6, Ellipsize::End) == "abc");
  assert(fit_text("abc", 0, Ellipsize::End).empty());
  assert(icon_glyph("window-close") == 'x');
  assert(icon_glyph("unknown-icon") == '*');

  TermWidgetFactory f;
  HeadlessTerminal term(3, 10);
  auto label = f.new_label("hi");
  node(label)->layout(Rect{0, 0, 1, 6});
  node(label)->draw(term);
  assert(term.row_text(0).substr(0, 6) == "  hi  ");
  assert(!term.highlighted(0, 2));
  label->add_css_class("pane-active");
  node(label)->draw(term);
  assert(term.highlighted(0, 2));

  auto button = f.new_button();
  button->set_icon_name("window-close");
  int w = 0, h = 0;
  node(button)->preferred_size(w, h);
  assert(w == 3);
  node(button)->layout(Rect{1, 0, 1, 3});
  node(button)->draw(term);
  assert(term.row_text(1).substr(0, 3) == "[x]");
}

static void test_text_view() {
  TermWidgetFactory f;
  auto view = f.new_text_view();
  std::vector<std::string> lines;
  for (int i = 0; i < 20; ++i) lines.push_back("line " + std::to_string(i));
  view->set_lines(lines);
  node(view)->layout(Rect{0, 0, 5, 10});
  assert(view->top_line() == 0);

  view->set_highlights({{3, 0, 4}, {12, 5, 2}}, 1);
  assert(view->current_highlight() == 1);
  assert(view->top_line() == 8);

  HeadlessTerminal term(5, 10);
  node(view)->draw(term);
  assert(term.row_text(4).substr(0, 7) == "line 12");
  assert(term.highlighted(4, 5));
  assert(!term.highlighted(4, 4));

  view->scroll_by(-100);
  assert(view->top_line() == 0);
  view->scroll_by(100);
  assert(view->top_line() == 15);
  view->scroll_to_line(2);
  assert(view->top_line() == 2);

  view->set_highlights({{1, 0, 1}}, 7);
  assert(view->current_highlight() == -1);
  view->clear_highlights();
  assert(view->highlights().empty());

  assert(view->grab_focus());
  assert(view->has_focus());
  auto label = f.new_label("no focus");
  assert(!label->grab_focus());
  view.reset();
  assert(f.context().focus() == nullptr);
}

static void test_pointer() {
  TermWidgetFactory f;
  auto overlay = f.new_overlay();
  auto body = f.new_box(Orientation::Vertical, 0);
  auto label = f.new_label("head");
  auto button = f.new_button();
  body->append(label);
  body->append(button);
  overlay->set_child(body);
  node(overlay)->layout(Rect{0, 0, 4, 10});

  int overlay_pressed = 0, clicked = 0;
  overlay->connect_pressed([&]{ overlay_pressed++; });
  button->connect_clicked([&]{ clicked++; });

  std::vector<TermNode*> path;
  hit_path(node(overlay), 0, 1, path);
  assert(path.size() == 3);
  assert(path.back() == node(label));
  assert(find_in_path<TermLabel>(path) == node(label));
  assert(find_in_path<TermButton>(path) == nullptr);

  // the label has no handlers, so the press bubbles to the overlay
  assert(dispatch_press(node(overlay), 0, 1));
  assert(overlay_pressed == 1);
  assert(dispatch_press(node(overlay), 1, 0));
  assert(clicked == 1);
  assert(overlay_pressed == 1);
  assert(button->has_focus());
  assert(!dispatch_press(node(overlay), 9, 9));

  label->set_can_target(false);
  hit_path(node(overlay), 0, 1, path);
  assert(path.back() == node(body));
  label->set_can_target(true);

  PointerTracker tracker(f.context());
  int label_enter = 0, label_leave = 0, overlay_enter = 0;
  label->connect_enter([&]{ label_enter++; });
  label->connect_leave([&]{ label_leave++; });
  overlay->connect_enter([&]{ overlay_enter++; });
  tracker.motion(node(overlay), 0, 1);
  assert(label_enter == 1 && overlay_enter == 1);
  tracker.motion(node(overlay), 0, 2);
  assert(label_enter == 1);
  tracker.motion(node(overlay), 1, 0);
  assert(label_leave == 1);
  assert(overlay_enter == 1);
  tracker.motion(node(overlay), 0, 0);
  assert(label_enter == 2);

  // a widget destroyed while hovered is skipped on leave
  body->remove(label.get());
  label.reset();
  tracker.leave_all();
  assert(tracker.hovered().empty());
  assert(label_leave == 1);
}

static void test_renderer() {
  StatusInfo st;
  st.mode = "TILE";
  st.location = "a.txt";
  st.position = "1/2";
  st.message = "ok";
  assert(Renderer::status_text(st) == "TILE  a.txt  1/2  | ok");
  StatusInfo empty;
  assert(Renderer::status_text(empty) == "TILE  [no pane]");
  StatusInfo cmd;
  cmd.command_mode = true;
  cmd.cmdline = "split";
  assert(Renderer::status_text(cmd) == ":split");
  cmd.cmdline = "/needle";
  assert(Renderer::status_text(cmd) == "/needle");

  TermWidgetFactory f;
  auto label = f.new_label("body");
  label->set_xalign(0.0f);
  HeadlessTerminal term(5, 30);
  Renderer r;
  r.render(term, label, st);
  assert(term.row_text(0).substr(0, 4) == "body");
  assert(label->allocated_height() == 4);
  assert(term.row_text(4).rfind("TILE  a.txt", 0) == 0);
  assert(term.refresh_count() == 1);
  assert(term.cursor_row() == 4);

  r.render(term, label, cmd);
  assert(term.cursor_col() == 7);
}

int main() {
  test_box_layout();
  test_ownership();
  test_paned();
  test_map_and_ticks();
  test_overlay();
  test_text();
  test_text_view();
  test_pointer();
  test_renderer();
  return 0;
}
