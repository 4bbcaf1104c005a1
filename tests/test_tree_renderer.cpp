#include "renderer.hpp"
#include "scheduler.hpp"
#include "term_widgets.hpp"
#include "tree_renderer.hpp"
#include <cassert>
#include <chrono>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace std::chrono_literals;

class LabelPanes : public PaneViewFactory {
public:
  explicit LabelPanes(WidgetFactory& f) : f_(f) {}
  WidgetPtr create_pane_widget(const PaneNode& leaf) override {
    if (omit.count(leaf.pane->id)) return nullptr;
    created++;
    return f_.new_label(leaf.pane->title);
  }
  std::set<std::string> omit;
  int created = 0;
private:
  WidgetFactory& f_;
};

static std::shared_ptr<Pane> pane(const std::string& id) {
  auto p = std::make_shared<Pane>();
  p->id = id;
  p->title = "title " + id;
  return p;
}

// split(a, stack(b, c))
static std::unique_ptr<PaneNode> sample_tree() {
  std::vector<std::unique_ptr<PaneNode>> kids;
  kids.push_back(make_leaf(pane("b")));
  kids.push_back(make_leaf(pane("c")));
  auto stack = make_stack("st", std::move(kids));
  stack->active_stack_index = 0;
  return make_split("sp", SplitDir::Horizontal, 0.25, make_leaf(pane("a")), std::move(stack));
}

static void test_build_registers_every_id() {
  TermWidgetFactory f;
  ManualClock clock;
  MainLoop loop(clock);
  LabelPanes panes(f);
  TreeRenderer tr(f, loop, &panes);
  auto root = sample_tree();
  WidgetPtr out;
  assert(tr.build(root.get(), out) == LayoutError::None);
  assert(out);
  assert(tr.node_count() == count_ids(*root));
  assert(tr.node_count() == 5);
  assert((tr.node_ids() == std::vector<std::string>{"a", "b", "c", "sp", "st"}));
  assert(tr.lookup("sp") == out);
  assert(tr.split_view("sp"));
  assert(tr.stacked_view("st"));
  assert(tr.stacked_view_for_pane("c") == tr.stacked_view("st"));
  assert(tr.stacked_view_for_pane("a") == nullptr);
  assert(tr.stacked_view("st")->active_index() == 0);
  WidgetPtr w;
  assert(tr.lookup_node("a", w));
  assert(!tr.lookup_node("nope", w));

  // rebuilding replaces the registry instead of adding to it
  assert(tr.build(root.get(), out) == LayoutError::None);
  assert(tr.node_count() == 5);
  tr.clear();
  assert(tr.node_count() == 0);
  assert(tr.split_view("sp") == nullptr);
}

static void test_errors() {
  TermWidgetFactory f;
  ManualClock clock;
  MainLoop loop(clock);
  LabelPanes panes(f);
  TreeRenderer tr(f, loop, &panes);
  WidgetPtr out;
  assert(tr.build(nullptr, out) == LayoutError::NilRoot);
  assert(!out);

  auto root = sample_tree();
  assert(tr.build(root.get(), out) == LayoutError::None);
  auto bad = make_split("bad", SplitDir::Vertical, 0.5, make_leaf(pane("x")), std::make_unique<PaneNode>());
  assert(tr.build(bad.get(), out) == LayoutError::InvalidNode);
  assert(!out);
  // a failed build leaves nothing half-registered
  assert(tr.node_count() == 0);
  assert(tr.update_split_ratio("sp", 0.5) == LayoutError::NodeNotFound);
}

static void test_omitted_leaves() {
  TermWidgetFactory f;
  ManualClock clock;
  MainLoop loop(clock);
  LabelPanes panes(f);
  panes.omit = {"a"};
  TreeRenderer tr(f, loop, &panes);
  auto root = sample_tree();
  WidgetPtr out;
  assert(tr.build(root.get(), out) == LayoutError::None);
  // the split collapses onto the surviving stack
  assert(out == tr.lookup("st"));
  assert(tr.lookup("a") == nullptr);
  assert(tr.split_view("sp") == nullptr);

  TreeRenderer bare(f, loop, nullptr);
  assert(bare.build(root.get(), out) == LayoutError::None);
  assert(!out);
  assert(bare.node_count() == 0);
}

static void test_unnamed_leaf_is_rendered_not_registered() {
  TermWidgetFactory f;
  ManualClock clock;
  MainLoop loop(clock);
  LabelPanes panes(f);
  TreeRenderer tr(f, loop, &panes);
  auto root = make_split("sp", SplitDir::Horizontal, 0.5, make_leaf(pane("x"), ""), make_leaf(pane("b")));
  WidgetPtr out;
  assert(tr.build(root.get(), out) == LayoutError::None);
  assert(out);
  assert(panes.created == 2);
  assert(tr.node_count() == 2);
  assert(tr.node_count() == count_ids(*root));
  assert(tr.lookup("") == nullptr);
  assert(tr.split_view("sp")->start_child());

  tr.clear();
  assert(tr.build(root.get(), out) == LayoutError::None);
  auto first_ids = tr.node_ids();
  int first_count = tr.node_count();
  tr.clear();
  assert(tr.build(root.get(), out) == LayoutError::None);
  assert(tr.node_ids() == first_ids);
  assert(tr.node_count() == first_count);
  assert((first_ids == std::vector<std::string>{"b", "sp"}));
}

static void test_unnamed_views_keep_their_hooks() {
  TermWidgetFactory f;
  ManualClock clock;
  MainLoop loop(clock);
  LabelPanes panes(f);
  SplitOptions opts;
  opts.notify_delay = 20ms;
  TreeRenderer tr(f, loop, &panes, opts);
  // the unnamed inner split is built before a node whose id looks generated
  auto inner = make_split("", SplitDir::Vertical, 0.5, make_leaf(pane("a")), make_leaf(pane("b")));
  std::vector<std::unique_ptr<PaneNode>> kids;
  kids.push_back(make_leaf(pane("c")));
  kids.push_back(make_leaf(pane("d")));
  auto stack = make_stack("", std::move(kids));
  auto root = make_split("#0", SplitDir::Horizontal, 0.5, std::move(inner),
                         make_split("#stack0", SplitDir::Vertical, 0.5, std::move(stack), make_leaf(pane("e"))));
  WidgetPtr out;
  assert(tr.build(root.get(), out) == LayoutError::None);
  assert(tr.split_view("#0") && tr.split_view("#stack0"));

  std::vector<std::pair<std::string, double>> ratios;
  std::vector<std::string> activated;
  tr.set_on_split_ratio_changed([&](const std::string& id, double r){ ratios.emplace_back(id, r); });
  tr.set_on_stack_activate([&](const std::string& id){ activated.push_back(id); });

  Renderer::layout_frame(out, Rect{0, 0, 20, 40});
  auto inner_paned = tr.split_view("#0")->paned()->start_child();
  assert(inner_paned);
  static_cast<TermPaned*>(inner_paned.get())->drag(5);
  clock.advance(20ms);
  loop.run_pending();
  assert(ratios.size() == 1);
  assert(ratios[0].first.empty());

  auto anon_stack = tr.stacked_view_for_pane("c");
  assert(anon_stack);
  assert(tr.stacked_view_for_pane("d") == anon_stack);
  assert(tr.stacked_view("#stack0") == nullptr);
  WidgetPtr bar;
  assert(anon_stack->title_bar(0, bar) == LayoutError::None);
  term_node(bar.get())->press();
  assert((activated == std::vector<std::string>{"c"}));
}

static void test_manual_registration() {
  TermWidgetFactory f;
  ManualClock clock;
  MainLoop loop(clock);
  TreeRenderer tr(f, loop, nullptr);
  tr.register_widget("extra", f.new_label("x"));
  tr.register_widget("", f.new_label("ignored"));
  tr.register_widget("null", nullptr);
  assert(tr.node_count() == 1);
  tr.unregister_widget("extra");
  assert(tr.node_count() == 0);
}

static void test_events_are_forwarded() {
  TermWidgetFactory f;
  ManualClock clock;
  MainLoop loop(clock);
  LabelPanes panes(f);
  SplitOptions opts;
  opts.notify_delay = 20ms;
  TreeRenderer tr(f, loop, &panes, opts);
  auto root = sample_tree();
  WidgetPtr out;
  assert(tr.build(root.get(), out) == LayoutError::None);

  std::string ratio_node;
  double ratio = -1.0;
  std::vector<std::string> activated, closed;
  tr.set_on_split_ratio_changed([&](const std::string& id, double r){ ratio_node = id; ratio = r; });
  tr.set_on_stack_activate([&](const std::string& id){ activated.push_back(id); });
  tr.set_on_stack_close([&](const std::string& id){ closed.push_back(id); });

  Renderer::layout_frame(out, Rect{0, 0, 10, 40});
  auto split = tr.split_view("sp");
  assert(split->paned()->position() == 10);
  static_cast<TermPaned*>(split->paned().get())->drag(10);
  clock.advance(20ms);
  loop.run_pending();
  assert(ratio_node == "sp");
  assert(ratio == 0.5);

  assert(tr.update_split_ratio("sp", 0.75) == LayoutError::None);
  assert(split->paned()->position() == 30);

  auto stack = tr.stacked_view("st");
  WidgetPtr bar;
  assert(stack->title_bar(1, bar) == LayoutError::None);
  term_node(bar.get())->press();
  assert((activated == std::vector<std::string>{"c"}));
  assert(stack->active_index() == 1);

  std::vector<TermNode*> kids;
  term_node(bar.get())->children(kids);
  kids.at(2)->press();
  assert((closed == std::vector<std::string>{"c"}));
}

int main() {
  test_build_registers_every_id();
  test_errors();
  test_omitted_leaves();
  test_unnamed_leaf_is_rendered_not_registered();
  test_unnamed_views_keep_their_hooks();
  test_manual_registration();
  test_events_are_forwarded();
  return 0;
}
