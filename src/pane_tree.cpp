#include "pane_tree.hpp"
#include <algorithm>
#include <atomic>

std::string generate_node_id(const char* prefix) {
  static std::atomic<unsigned long> counter{1};
  return std::string(prefix) + "-" + std::to_string(counter.fetch_add(1));
}

std::unique_ptr<PaneNode> make_leaf(std::shared_ptr<Pane> pane) {
  std::string id = pane ? pane->id : std::string();
  return make_leaf(std::move(pane), std::move(id));
}

std::unique_ptr<PaneNode> make_leaf(std::shared_ptr<Pane> pane, std::string node_id) {
  auto node = std::make_unique<PaneNode>();
  node->id = std::move(node_id);
  node->pane = std::move(pane);
  return node;
}

std::unique_ptr<PaneNode> make_split(std::string id, SplitDir dir, double ratio,
                                     std::unique_ptr<PaneNode> start,
                                     std::unique_ptr<PaneNode> end) {
  auto node = std::make_unique<PaneNode>();
  node->id = std::move(id);
  node->split_dir = dir;
  node->split_ratio = std::clamp(ratio, 0.0, 1.0);
  node->children.push_back(std::move(start));
  node->children.push_back(std::move(end));
  return node;
}

std::unique_ptr<PaneNode> make_stack(std::string id, std::vector<std::unique_ptr<PaneNode>> children) {
  auto node = std::make_unique<PaneNode>();
  node->id = std::move(id);
  node->is_stacked = true;
  node->children = std::move(children);
  node->active_stack_index = node->children.empty() ? 0 : static_cast<int>(node->children.size()) - 1;
  return node;
}

bool validate_tree(const PaneNode& node, std::string& msg) {
  if (node.is_leaf()) return true;
  if (node.is_split() || node.is_stack()) {
    for (const auto& c : node.children) {
      if (!c) { msg = "node " + node.id + " has a null child"; return false; }
      if (!validate_tree(*c, msg)) return false;
    }
    return true;
  }
  msg = "node " + node.id + " is neither leaf, split nor stack";
  return false;
}

bool validate_workspace(const Workspace& ws, std::string& msg) {
  if (!ws.root) return true;
  if (!validate_tree(*ws.root, msg)) return false;
  if (ws.active_pane_id.empty()) { msg = "workspace has no active pane"; return false; }
  if (!find_leaf(ws.root.get(), ws.active_pane_id)) {
    msg = "active pane " + ws.active_pane_id + " is not in the tree";
    return false;
  }
  return true;
}

PaneNode* find_node(PaneNode* root, const std::string& id) {
  if (!root) return nullptr;
  if (root->id == id) return root;
  for (auto& c : root->children) {
    if (PaneNode* hit = find_node(c.get(), id)) return hit;
  }
  return nullptr;
}

PaneNode* find_leaf(PaneNode* root, const std::string& pane_id) {
  if (!root) return nullptr;
  if (root->is_leaf()) return root->pane->id == pane_id ? root : nullptr;
  for (auto& c : root->children) {
    if (PaneNode* hit = find_leaf(c.get(), pane_id)) return hit;
  }
  return nullptr;
}

PaneNode* find_parent(PaneNode* root, const PaneNode* child) {
  if (!root || !child) return nullptr;
  for (auto& c : root->children) {
    if (c.get() == child) return root;
    if (PaneNode* hit = find_parent(c.get(), child)) return hit;
  }
  return nullptr;
}

void collect_leaves(const PaneNode& node, std::vector<const PaneNode*>& out) {
  if (node.is_leaf()) { out.push_back(&node); return; }
  for (const auto& c : node.children) if (c) collect_leaves(*c, out);
}

int count_ids(const PaneNode& node) {
  int n = node.id.empty() ? 0 : 1;
  for (const auto& c : node.children) if (c) n += count_ids(*c);
  return n;
}

std::string first_pane_id(const PaneNode* root) {
  if (!root) return std::string();
  std::vector<const PaneNode*> leaves;
  collect_leaves(*root, leaves);
  return leaves.empty() ? std::string() : leaves.front()->pane->id;
}

// Returns the owning slot of the leaf holding pane_id.
static std::unique_ptr<PaneNode>* find_slot(std::unique_ptr<PaneNode>& node, const std::string& pane_id) {
  if (!node) return nullptr;
  if (node->is_leaf()) return node->pane->id == pane_id ? &node : nullptr;
  for (auto& c : node->children) {
    if (auto* hit = find_slot(c, pane_id)) return hit;
  }
  return nullptr;
}

static std::unique_ptr<PaneNode>* find_slot_of(std::unique_ptr<PaneNode>& node, const PaneNode* target) {
  if (!node) return nullptr;
  if (node.get() == target) return &node;
  for (auto& c : node->children) {
    if (auto* hit = find_slot_of(c, target)) return hit;
  }
  return nullptr;
}

bool split_pane(Workspace& ws, const std::string& target_pane_id, std::shared_ptr<Pane> pane,
                SplitDir dir, double ratio) {
  if (!pane || dir == SplitDir::None) return false;
  auto* slot = find_slot(ws.root, target_pane_id);
  if (!slot) return false;
  // a pane inside a stack splits the whole stack
  if (PaneNode* parent = find_parent(ws.root.get(), slot->get()); parent && parent->is_stacked) {
    slot = find_slot_of(ws.root, parent);
    if (!slot) return false;
  }
  std::string new_id = pane->id;
  auto old = std::move(*slot);
  *slot = make_split(generate_node_id("split"), dir, ratio, std::move(old), make_leaf(std::move(pane)));
  ws.active_pane_id = new_id;
  return true;
}

bool stack_pane(Workspace& ws, const std::string& target_pane_id, std::shared_ptr<Pane> pane) {
  if (!pane) return false;
  auto* slot = find_slot(ws.root, target_pane_id);
  if (!slot) return false;
  std::string new_id = pane->id;
  PaneNode* parent = find_parent(ws.root.get(), slot->get());
  if (parent && parent->is_stacked) {
    auto it = std::find_if(parent->children.begin(), parent->children.end(),
                           [&](const std::unique_ptr<PaneNode>& c){ return c.get() == slot->get(); });
    int idx = static_cast<int>(it - parent->children.begin());
    parent->children.insert(parent->children.begin() + idx + 1, make_leaf(std::move(pane)));
    parent->active_stack_index = idx + 1;
  } else {
    std::vector<std::unique_ptr<PaneNode>> kids;
    kids.push_back(std::move(*slot));
    kids.push_back(make_leaf(std::move(pane)));
    *slot = make_stack(generate_node_id("stack"), std::move(kids));
  }
  ws.active_pane_id = new_id;
  return true;
}

// Shrinks node after its child at removed_index went away.
static void collapse_after_removal(std::unique_ptr<PaneNode>& node, int removed_index) {
  if (node->children.empty()) { node.reset(); return; }
  if (node->children.size() == 1) { node = std::move(node->children.front()); return; }
  if (node->is_stacked) {
    int count = static_cast<int>(node->children.size());
    if (node->active_stack_index >= count) node->active_stack_index = count - 1;
    else if (node->active_stack_index > removed_index) node->active_stack_index--;
  }
}

static std::unique_ptr<PaneNode> detach_leaf(std::unique_ptr<PaneNode>& node, const std::string& pane_id) {
  if (!node) return nullptr;
  if (node->is_leaf()) {
    if (node->pane->id != pane_id) return nullptr;
    return std::move(node);
  }
  for (size_t i = 0; i < node->children.size(); ++i) {
    auto removed = detach_leaf(node->children[i], pane_id);
    if (!removed) continue;
    node->children.erase(node->children.begin() + static_cast<long>(i));
    collapse_after_removal(node, static_cast<int>(i));
    return removed;
  }
  return nullptr;
}

bool close_pane(Workspace& ws, const std::string& pane_id, std::string& msg) {
  if (!ws.root) { msg = "workspace is empty"; return false; }
  if (ws.root->is_leaf()) {
    msg = ws.root->pane->id == pane_id ? "cannot close last pane" : "pane not found: " + pane_id;
    return false;
  }
  auto removed = detach_leaf(ws.root, pane_id);
  if (!removed) { msg = "pane not found: " + pane_id; return false; }
  if (ws.active_pane_id == pane_id) ws.active_pane_id = first_pane_id(ws.root.get());
  msg = "closed " + pane_id;
  return true;
}

bool move_pane(Workspace& ws, const std::string& pane_id, const std::string& target_pane_id,
               SplitDir dir, double ratio, std::string& msg) {
  if (pane_id == target_pane_id) { msg = "cannot move a pane next to itself"; return false; }
  if (!find_leaf(ws.root.get(), target_pane_id)) { msg = "pane not found: " + target_pane_id; return false; }
  if (!ws.root || ws.root->is_leaf()) { msg = "nothing to move"; return false; }
  auto removed = detach_leaf(ws.root, pane_id);
  if (!removed) { msg = "pane not found: " + pane_id; return false; }
  if (!split_pane(ws, target_pane_id, removed->pane, dir, ratio)) {
    msg = "move failed";
    return false;
  }
  msg = "moved " + pane_id;
  return true;
}

bool set_stack_active(Workspace& ws, const std::string& pane_id) {
  PaneNode* leaf = find_leaf(ws.root.get(), pane_id);
  PaneNode* parent = find_parent(ws.root.get(), leaf);
  if (!leaf || !parent || !parent->is_stacked) return false;
  for (size_t i = 0; i < parent->children.size(); ++i) {
    if (parent->children[i].get() == leaf) {
      parent->active_stack_index = static_cast<int>(i);
      return true;
    }
  }
  return false;
}
