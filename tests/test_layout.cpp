#include "pane_layout.hpp"
#include "types.hpp"
#include "config.hpp"
#include <cassert>
#include <vector>

static int width_for_pane(const std::vector<PaneRect>& rs, int pane) {
  for (const auto& r : rs) if (r.pane == pane) return r.rect.width;
  return -1;
}

static int height_for_pane(const std::vector<PaneRect>& rs, int pane) {
  for (const auto& r : rs) if (r.pane == pane) return r.rect.height;
  return -1;
}

static int P(PaneId p) { return static_cast<int>(p); }

static void test_splits() {
  auto root = std::make_unique<SplitNode>();
  root->type = SplitNode::Type::Leaf;
  root->pane = 0;
  Rect screen{0, 0, 24, 80};
  std::vector<PaneRect> rs;
  collect_layout(*root, screen, rs);
  assert(rs.size() == 1);
  assert(rs[0].rect.width == 80);

  replace_leaf_with_vertical(root, 0, 1, 0.5f);
  rs.clear();
  collect_layout(*root, screen, rs);
  assert(rs.size() == 2);
  assert(width_for_pane(rs, 0) + width_for_pane(rs, 1) == 80);

  replace_leaf_with_horizontal(root, 1, 2, 0.5f, 5);
  rs.clear();
  collect_layout(*root, screen, rs);
  assert(rs.size() == 3);
  assert(height_for_pane(rs, 2) == 5);
  assert(height_for_pane(rs, 1) == 19);
  assert(!replace_leaf_with_vertical(root, 9, 3, 0.5f));
}

static void test_app_layout() {
  Rect screen{0, 0, 40, 120};
  LayoutFlags flags;
  std::vector<PaneRect> rs;
  collect_layout(*build_layout(flags), screen, rs);
  assert(rs.size() == 5);
  assert(height_for_pane(rs, P(PaneId::MiniBuffer)) == H5F_BAR_HEIGHT);
  assert(height_for_pane(rs, P(PaneId::Hotkeys)) == 3);
  assert(height_for_pane(rs, P(PaneId::Metadata)) == H5F_METADATA_HEIGHT);
  assert(height_for_pane(rs, P(PaneId::Progress)) == -1);
  const PaneRect* tree = find_pane(rs, P(PaneId::Tree));
  const PaneRect* mini = find_pane(rs, P(PaneId::MiniBuffer));
  assert(tree && mini);
  assert(tree->rect.row == 0 && tree->rect.col == 0);
  assert(mini->rect.row + mini->rect.height == 40);
  assert(height_for_pane(rs, P(PaneId::Tree)) == 40 - 3 - 3 - H5F_METADATA_HEIGHT);

  flags.lower_pane = P(PaneId::Values);
  flags.progress = true;
  rs.clear();
  collect_layout(*build_layout(flags), screen, rs);
  assert(rs.size() == 7);
  int attrs = height_for_pane(rs, P(PaneId::Attributes));
  int values = height_for_pane(rs, P(PaneId::Values));
  assert(values > attrs);
  assert(height_for_pane(rs, P(PaneId::Progress)) == H5F_BAR_HEIGHT);

  flags.attributes_expanded = true;
  rs.clear();
  collect_layout(*build_layout(flags), screen, rs);
  assert(width_for_pane(rs, P(PaneId::Attributes)) > width_for_pane(rs, P(PaneId::Tree)));
  assert(find_pane(rs, P(PaneId::Values))->rect.contains(find_pane(rs, P(PaneId::Values))->rect.row, 119));
}

int main() {
  test_splits();
  test_app_layout();
  return 0;
}
