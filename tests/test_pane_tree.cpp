#include "pane_tree.hpp"
#include <cassert>
#include <string>
#include <vector>

static std::shared_ptr<Pane> pane(const std::string& id) {
  auto p = std::make_shared<Pane>();
  p->id = id;
  p->title = id;
  return p;
}

static Workspace single(const std::string& id) {
  Workspace ws;
  ws.id = "ws";
  ws.root = make_leaf(pane(id));
  ws.active_pane_id = id;
  return ws;
}

static std::vector<std::string> leaf_ids(const Workspace& ws) {
  std::vector<const PaneNode*> leaves;
  if (ws.root) collect_leaves(*ws.root, leaves);
  std::vector<std::string> ids;
  for (auto* l : leaves) ids.push_back(l->pane->id);
  return ids;
}

static void test_node_kinds() {
  auto leaf = make_leaf(pane("a"));
  assert(leaf->is_leaf());
  assert(!leaf->is_split() && !leaf->is_stack());
  assert(leaf->id == "a");

  auto split = make_split("s", SplitDir::Horizontal, 1.7, make_leaf(pane("a")), make_leaf(pane("b")));
  assert(split->is_split());
  assert(split->split_ratio == 1.0);
  assert(split->left()->pane->id == "a");
  assert(split->right()->pane->id == "b");

  std::vector<std::unique_ptr<PaneNode>> kids;
  kids.push_back(make_leaf(pane("a")));
  kids.push_back(make_leaf(pane("b")));
  auto stack = make_stack("st", std::move(kids));
  assert(stack->is_stack());
  assert(stack->active_stack_index == 1);

  std::string msg;
  assert(validate_tree(*split, msg));
  PaneNode bogus;
  bogus.id = "x";
  assert(!validate_tree(bogus, msg));
  assert(msg.find("x") != std::string::npos);
}

static void test_generate_ids_are_unique() {
  std::string a = generate_node_id("split");
  std::string b = generate_node_id("split");
  assert(a != b);
  assert(a.rfind("split-", 0) == 0);
}

static void test_split_and_close() {
  Workspace ws = single("a");
  assert(split_pane(ws, "a", pane("b"), SplitDir::Horizontal, 0.5));
  assert(ws.root->is_split());
  assert(ws.active_pane_id == "b");
  assert(count_ids(*ws.root) == 3);
  assert((leaf_ids(ws) == std::vector<std::string>{"a", "b"}));

  assert(!split_pane(ws, "missing", pane("c"), SplitDir::Vertical, 0.5));
  assert(!split_pane(ws, "a", pane("c"), SplitDir::None, 0.5));

  std::string msg;
  assert(validate_workspace(ws, msg));
  assert(close_pane(ws, "b", msg));
  assert(ws.root->is_leaf());
  assert(ws.active_pane_id == "a");
  assert(!close_pane(ws, "a", msg));
  assert(msg == "cannot close last pane");
  assert(!close_pane(ws, "zz", msg));
}

static void test_stack_ops() {
  Workspace ws = single("a");
  assert(stack_pane(ws, "a", pane("b")));
  assert(ws.root->is_stack());
  assert(ws.root->active_stack_index == 1);
  // stacking onto a stacked pane inserts right after it
  assert(stack_pane(ws, "a", pane("c")));
  assert((leaf_ids(ws) == std::vector<std::string>{"a", "c", "b"}));
  assert(ws.root->active_stack_index == 1);
  assert(ws.active_pane_id == "c");

  assert(set_stack_active(ws, "b"));
  assert(ws.root->active_stack_index == 2);

  std::string msg;
  assert(close_pane(ws, "a", msg));
  assert(ws.root->active_stack_index == 1);
  assert(close_pane(ws, "c", msg));
  // a stack left with one child collapses to that leaf
  assert(ws.root->is_leaf());
  assert(ws.root->pane->id == "b");
  assert(!set_stack_active(ws, "b"));
}

static void test_split_inside_stack_splits_the_stack() {
  Workspace ws = single("a");
  assert(stack_pane(ws, "a", pane("b")));
  std::string stack_id = ws.root->id;
  assert(split_pane(ws, "b", pane("c"), SplitDir::Vertical, 0.3));
  assert(ws.root->is_split());
  assert(ws.root->left()->id == stack_id);
  assert(ws.root->right()->pane->id == "c");
  assert(ws.root->split_ratio == 0.3);
}

static void test_move() {
  Workspace ws = single("a");
  assert(split_pane(ws, "a", pane("b"), SplitDir::Horizontal, 0.5));
  assert(split_pane(ws, "b", pane("c"), SplitDir::Vertical, 0.5));
  std::string msg;
  assert(!move_pane(ws, "a", "a", SplitDir::Horizontal, 0.5, msg));
  assert(!move_pane(ws, "a", "nope", SplitDir::Horizontal, 0.5, msg));
  assert(move_pane(ws, "c", "a", SplitDir::Vertical, 0.5, msg));
  PaneNode* c = find_leaf(ws.root.get(), "c");
  PaneNode* parent = find_parent(ws.root.get(), c);
  assert(parent && parent->is_split());
  assert(parent->split_dir == SplitDir::Vertical);
  assert(parent->left()->pane->id == "a");
  assert(validate_workspace(ws, msg));
  assert(first_pane_id(ws.root.get()) == "a");
}

static void test_find() {
  Workspace ws = single("a");
  assert(split_pane(ws, "a", pane("b"), SplitDir::Horizontal, 0.5));
  std::string split_id = ws.root->id;
  assert(find_node(ws.root.get(), split_id) == ws.root.get());
  assert(find_leaf(ws.root.get(), "b") == ws.root->right());
  assert(find_parent(ws.root.get(), ws.root.get()) == nullptr);
  assert(find_leaf(nullptr, "b") == nullptr);
  assert(first_pane_id(nullptr).empty());
}

int main() {
  test_node_kinds();
  test_generate_ids_are_unique();
  test_split_and_close();
  test_stack_ops();
  test_split_inside_stack_splits_the_stack();
  test_move();
  test_find();
  return 0;
}
