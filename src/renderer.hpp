#pragma once
/*
 * Renderer
 *
 * Purpose: draw the pane frames (tree, metadata, attributes, values/plots) and
 * the bottom bars (hot keys, progress, mini buffer) and scroll pane viewports.
 * Dependency: draws via ITerminal to allow backend replacement.
 * Constraint: stateless; receives snapshots from App to render. Viewports and
 * scroll offsets are passed by pointer and clamped in place.
 */
#include <string>
#include <vector>
#include "types.hpp"
#include "iterminal.hpp"
#include "pane_layout.hpp"
#include "tree_text.hpp"

struct PaneRenderInfo {
  PaneId pane = PaneId::Metadata;
  Rect area{};
  std::string title;
  std::string text;
  int* scroll = nullptr;
  bool is_active = false;
};

struct FrameRenderInfo {
  const TreeText* tree = nullptr;
  Rect tree_area{};
  std::string tree_title;
  int cursor_row = 0;
  int cursor_col = 0;
  Viewport* tree_vp = nullptr;
  bool tree_active = true;
  std::vector<PaneRenderInfo> panes;
  Rect hotkeys_area{};
  std::vector<std::string> hints;
  Rect progress_area{};
  double progress = -1.0; // < 0 when no job is running
  std::string progress_label;
  Rect mini_area{};
  std::string mini_title;
  std::string prompt;
  std::string mini_text;
  bool awaiting_input = false;
  int input_cursor = 0;
};

class Renderer {
public:
  void render(ITerminal& term, FrameRenderInfo& frame);
  // hints packed into lines no wider than width, two spaces apart
  static std::vector<std::string> pack_hints(const std::vector<std::string>& hints, int width);
  static std::string progress_bar(double fraction, int width);

private:
  void draw_tree(ITerminal& term, FrameRenderInfo& frame);
  void draw_pane(ITerminal& term, PaneRenderInfo& pane);
};
