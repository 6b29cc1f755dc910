#pragma once
/*
 * Pane layout
 *
 * Purpose: split tree describing where each pane frame sits on screen.
 * A split gives `a` the ratio share of the area, or everything but `fixed`
 * rows/cols when fixed > 0 (fixed-height bars at the bottom of the screen).
 */
#include <memory>
#include <vector>

struct Rect {
  int row = 0;
  int col = 0;
  int height = 0;
  int width = 0;

  bool contains(int r, int c) const { return r >= row && r < row + height && c >= col && c < col + width; }
};

struct PaneRect {
  int pane = 0;
  Rect rect;
};

struct SplitNode {
  enum class Type { Leaf, Vertical, Horizontal };
  Type type = Type::Leaf;
  int pane = 0; // valid when leaf
  std::unique_ptr<SplitNode> a;
  std::unique_ptr<SplitNode> b;
  float ratio = 0.5f; // left/top share for split nodes
  int fixed = 0;      // size of b when > 0, overrides ratio
};

struct LayoutFlags {
  bool attributes_expanded = false;
  int lower_pane = -1;   // Values, Plot or Histogram under the attributes, -1 for none
  bool progress = false; // show the progress bar
  int hotkey_rows = 1;
};

void collect_layout(const SplitNode& node, const Rect& area, std::vector<PaneRect>& out);
bool replace_leaf_with_vertical(std::unique_ptr<SplitNode>& root, int target_pane, int new_pane, float ratio, int fixed = 0);
bool replace_leaf_with_horizontal(std::unique_ptr<SplitNode>& root, int target_pane, int new_pane, float ratio, int fixed = 0);
std::unique_ptr<SplitNode> build_layout(const LayoutFlags& flags);
const PaneRect* find_pane(const std::vector<PaneRect>& rs, int pane);
