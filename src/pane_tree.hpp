#pragma once
/*
 * PaneTree
 *
 * Purpose: domain tree of panes (leaf / split / stack) and the owning Workspace.
 * Ops: split, stack, close and move panes; every op keeps the node-kind
 * invariant (leaf: pane, no children; split: exactly 2 children; stack: >= 1).
 * Note: widgets never live here; the layout engine derives them on rebuild.
 */
#include <memory>
#include <string>
#include <vector>

enum class SplitDir { None, Horizontal, Vertical };

struct Pane {
  std::string id;
  std::string title;
  std::string uri;
};

struct PaneNode {
  std::string id;
  std::shared_ptr<Pane> pane;  // set for leaves only
  SplitDir split_dir = SplitDir::None;
  double split_ratio = 0.5;    // start child share for splits
  bool is_stacked = false;
  int active_stack_index = 0;
  std::vector<std::unique_ptr<PaneNode>> children;

  bool is_leaf() const { return pane != nullptr && children.empty(); }
  bool is_split() const { return pane == nullptr && !is_stacked && children.size() == 2; }
  bool is_stack() const { return pane == nullptr && is_stacked && !children.empty(); }
  PaneNode* left() const { return children.size() > 0 ? children[0].get() : nullptr; }
  PaneNode* right() const { return children.size() > 1 ? children[1].get() : nullptr; }
};

struct Workspace {
  std::string id;
  std::unique_ptr<PaneNode> root;
  std::string active_pane_id;
};

std::string generate_node_id(const char* prefix);

std::unique_ptr<PaneNode> make_leaf(std::shared_ptr<Pane> pane);
std::unique_ptr<PaneNode> make_leaf(std::shared_ptr<Pane> pane, std::string node_id);
std::unique_ptr<PaneNode> make_split(std::string id, SplitDir dir, double ratio,
                                     std::unique_ptr<PaneNode> start,
                                     std::unique_ptr<PaneNode> end);
std::unique_ptr<PaneNode> make_stack(std::string id, std::vector<std::unique_ptr<PaneNode>> children);

bool validate_tree(const PaneNode& node, std::string& msg);
bool validate_workspace(const Workspace& ws, std::string& msg);

PaneNode* find_node(PaneNode* root, const std::string& id);
PaneNode* find_leaf(PaneNode* root, const std::string& pane_id);
PaneNode* find_parent(PaneNode* root, const PaneNode* child);
void collect_leaves(const PaneNode& node, std::vector<const PaneNode*>& out);
int count_ids(const PaneNode& node);
std::string first_pane_id(const PaneNode* root);

bool split_pane(Workspace& ws, const std::string& target_pane_id, std::shared_ptr<Pane> pane,
                SplitDir dir, double ratio);
bool stack_pane(Workspace& ws, const std::string& target_pane_id, std::shared_ptr<Pane> pane);
bool close_pane(Workspace& ws, const std::string& pane_id, std::string& msg);
bool move_pane(Workspace& ws, const std::string& pane_id, const std::string& target_pane_id,
               SplitDir dir, double ratio, std::string& msg);
// marks pane_id as the active child of its enclosing stack, if any
bool set_stack_active(Workspace& ws, const std::string& pane_id);
