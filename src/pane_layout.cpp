#include "pane_layout.hpp"
#include "config.hpp"
#include "types.hpp"
#include <algorithm>

static int clamp_split(int total, float ratio, int fixed) {
  if (total <= 1) return total;
  int primary = fixed > 0 ? total - fixed : static_cast<int>(total * ratio);
  primary = std::clamp(primary, 1, total - 1);
  return primary;
}

void collect_layout(const SplitNode& node, const Rect& area, std::vector<PaneRect>& out) {
  if (area.height <= 0 || area.width <= 0) return;
  if (node.type == SplitNode::Type::Leaf) {
    out.push_back(PaneRect{node.pane, area});
    return;
  }
  if (node.type == SplitNode::Type::Vertical) {
    int left_w = clamp_split(area.width, node.ratio, node.fixed);
    Rect left{area.row, area.col, area.height, left_w};
    Rect right{area.row, area.col + left_w, area.height, area.width - left_w};
    if (node.a) collect_layout(*node.a, left, out);
    if (node.b) collect_layout(*node.b, right, out);
  } else {
    int top_h = clamp_split(area.height, node.ratio, node.fixed);
    Rect top{area.row, area.col, top_h, area.width};
    Rect bottom{area.row + top_h, area.col, area.height - top_h, area.width};
    if (node.a) collect_layout(*node.a, top, out);
    if (node.b) collect_layout(*node.b, bottom, out);
  }
}

static std::unique_ptr<SplitNode> leaf(int pane) {
  auto n = std::make_unique<SplitNode>();
  n->type = SplitNode::Type::Leaf;
  n->pane = pane;
  return n;
}

static bool replace_leaf(std::unique_ptr<SplitNode>& node, int target, int new_pane, SplitNode::Type t, float ratio, int fixed) {
  if (!node) return false;
  if (node->type == SplitNode::Type::Leaf) {
    if (node->pane != target) return false;
    auto old = std::move(node);
    node = std::make_unique<SplitNode>();
    node->type = t;
    node->ratio = ratio;
    node->fixed = fixed;
    node->a = std::move(old);
    node->b = leaf(new_pane);
    return true;
  }
  return replace_leaf(node->a, target, new_pane, t, ratio, fixed) || replace_leaf(node->b, target, new_pane, t, ratio, fixed);
}

bool replace_leaf_with_vertical(std::unique_ptr<SplitNode>& root, int target_pane, int new_pane, float ratio, int fixed) {
  return replace_leaf(root, target_pane, new_pane, SplitNode::Type::Vertical, ratio, fixed);
}

bool replace_leaf_with_horizontal(std::unique_ptr<SplitNode>& root, int target_pane, int new_pane, float ratio, int fixed) {
  return replace_leaf(root, target_pane, new_pane, SplitNode::Type::Horizontal, ratio, fixed);
}

// puts a fixed-height bar below everything built so far
static std::unique_ptr<SplitNode> stack_bar(std::unique_ptr<SplitNode> top, int pane, int rows) {
  auto n = std::make_unique<SplitNode>();
  n->type = SplitNode::Type::Horizontal;
  n->fixed = rows;
  n->a = std::move(top);
  n->b = leaf(pane);
  return n;
}

std::unique_ptr<SplitNode> build_layout(const LayoutFlags& flags) {
  const int tree = static_cast<int>(PaneId::Tree);
  const int attrs = static_cast<int>(PaneId::Attributes);
  auto root = leaf(tree);
  replace_leaf_with_vertical(root, tree, attrs, flags.attributes_expanded ? 0.35f : 0.5f);
  replace_leaf_with_horizontal(root, tree, static_cast<int>(PaneId::Metadata), 0.5f, H5F_METADATA_HEIGHT);
  if (flags.lower_pane >= 0) {
    replace_leaf_with_horizontal(root, attrs, flags.lower_pane, flags.attributes_expanded ? 0.5f : 0.25f);
  }
  root = stack_bar(std::move(root), static_cast<int>(PaneId::Hotkeys), std::max(1, flags.hotkey_rows) + 2);
  if (flags.progress) root = stack_bar(std::move(root), static_cast<int>(PaneId::Progress), H5F_BAR_HEIGHT);
  root = stack_bar(std::move(root), static_cast<int>(PaneId::MiniBuffer), H5F_BAR_HEIGHT);
  return root;
}

const PaneRect* find_pane(const std::vector<PaneRect>& rs, int pane) {
  for (const auto& r : rs) if (r.pane == pane) return &r;
  return nullptr;
}
