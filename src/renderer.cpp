#include "renderer.hpp"
#include <algorithm>
#include <cmath>

static std::vector<std::string> split_lines(const std::string& s) {
  std::vector<std::string> out;
  size_t start = 0;
  while (true) {
    size_t nl = s.find('\n', start);
    if (nl == std::string::npos) { out.push_back(s.substr(start)); break; }
    out.push_back(s.substr(start, nl - start));
    start = nl + 1;
  }
  return out;
}

static std::string clip(const std::string& s, int from, int width) {
  if (width <= 0 || from >= (int)s.size()) return std::string();
  return s.substr(static_cast<size_t>(from), static_cast<size_t>(width));
}

std::vector<std::string> Renderer::pack_hints(const std::vector<std::string>& hints, int width) {
  std::vector<std::string> lines;
  std::string cur;
  for (const auto& h : hints) {
    if (!cur.empty() && (int)(cur.size() + 2 + h.size()) > width) {
      lines.push_back(cur);
      cur.clear();
    }
    if (!cur.empty()) cur += "  ";
    cur += h;
  }
  if (!cur.empty()) lines.push_back(cur);
  return lines;
}

std::string Renderer::progress_bar(double fraction, int width) {
  fraction = std::clamp(fraction, 0.0, 1.0);
  std::string pct = " " + std::to_string(static_cast<int>(std::lround(fraction * 100))) + "%";
  int inner = std::max(1, width - 2 - (int)pct.size());
  int filled = static_cast<int>(fraction * inner);
  return "[" + std::string(static_cast<size_t>(filled), '#') + std::string(static_cast<size_t>(inner - filled), ' ') + "]" + pct;
}

void Renderer::draw_tree(ITerminal& term, FrameRenderInfo& frame) {
  const Rect& a = frame.tree_area;
  if (a.height <= 0 || a.width <= 0) return;
  term.draw_frame(a.row, a.col, a.height, a.width, frame.tree_title, frame.tree_active);
  if (!frame.tree || !frame.tree_vp) return;
  Viewport& vp = *frame.tree_vp;
  int text_rows = std::max(0, a.height - 2);
  int text_cols = std::max(0, a.width - 2);
  const int cur_row = frame.cursor_row;
  if (cur_row < vp.top_line) vp.top_line = cur_row;
  if (cur_row >= vp.top_line + text_rows) vp.top_line = cur_row - text_rows + 1;
  vp.top_line = std::clamp(vp.top_line, 0, std::max(0, frame.tree->row_count() - 1));
  if (text_cols > 0) {
    if (frame.cursor_col < vp.left_col) vp.left_col = frame.cursor_col;
    else if (frame.cursor_col >= vp.left_col + text_cols) vp.left_col = frame.cursor_col - text_cols + 1;
    if (vp.left_col < 0) vp.left_col = 0;
  }
  for (int i = 0; i < text_rows; ++i) {
    int r = vp.top_line + i;
    if (r >= frame.tree->row_count()) break;
    std::string vis = clip(frame.tree->line(r), vp.left_col, text_cols);
    if (r == cur_row) {
      vis.resize(static_cast<size_t>(text_cols), ' ');
      term.draw_highlighted(a.row + 1 + i, a.col + 1, vis, 0, text_cols);
    } else {
      term.draw_text(a.row + 1 + i, a.col + 1, vis);
    }
  }
}

void Renderer::draw_pane(ITerminal& term, PaneRenderInfo& pane) {
  const Rect& a = pane.area;
  if (a.height <= 0 || a.width <= 0) return;
  term.draw_frame(a.row, a.col, a.height, a.width, pane.title, pane.is_active);
  int text_rows = std::max(0, a.height - 2);
  int text_cols = std::max(0, a.width - 2);
  std::vector<std::string> lines = split_lines(pane.text);
  int top = 0;
  if (pane.scroll) {
    *pane.scroll = std::clamp(*pane.scroll, 0, std::max(0, (int)lines.size() - text_rows));
    top = *pane.scroll;
  }
  for (int i = 0; i < text_rows; ++i) {
    int r = top + i;
    if (r >= (int)lines.size()) break;
    term.draw_text(a.row + 1 + i, a.col + 1, clip(lines[static_cast<size_t>(r)], 0, text_cols));
  }
}

void Renderer::render(ITerminal& term, FrameRenderInfo& frame) {
  term.clear();
  draw_tree(term, frame);
  for (auto& p : frame.panes) draw_pane(term, p);

  const Rect& hk = frame.hotkeys_area;
  if (hk.height > 0 && hk.width > 0) {
    term.draw_frame(hk.row, hk.col, hk.height, hk.width, "Hotkeys", false);
    auto lines = pack_hints(frame.hints, hk.width - 2);
    for (int i = 0; i < (int)lines.size() && i < hk.height - 2; ++i) {
      term.draw_colored(hk.row + 1 + i, hk.col + 1, clip(lines[static_cast<size_t>(i)], 0, hk.width - 2), 3);
    }
  }

  const Rect& pg = frame.progress_area;
  if (pg.height > 0 && pg.width > 0 && frame.progress >= 0.0) {
    term.draw_frame(pg.row, pg.col, pg.height, pg.width, frame.progress_label, false);
    term.draw_text(pg.row + 1, pg.col + 1, progress_bar(frame.progress, pg.width - 2));
  }

  const Rect& mb = frame.mini_area;
  int rows = term.getSize().rows;
  if (mb.height > 0 && mb.width > 0) {
    term.draw_frame(mb.row, mb.col, mb.height, mb.width, frame.mini_title, frame.awaiting_input);
    int inner = mb.width - 2;
    if (frame.awaiting_input) {
      std::string lead = frame.prompt + " ";
      int shift = std::max(0, (int)lead.size() + frame.input_cursor - inner + 1);
      std::string line = lead + frame.mini_text;
      term.draw_text(mb.row + 1, mb.col + 1, clip(line, shift, inner));
      term.move_cursor(mb.row + 1, mb.col + 1 + (int)lead.size() + frame.input_cursor - shift);
      term.show_cursor(true);
      term.refresh();
      return;
    }
    std::string msg = clip(split_lines(frame.mini_text).front(), 0, inner);
    if (msg.rfind("ERROR:", 0) == 0) term.draw_colored(mb.row + 1, mb.col + 1, msg, 4);
    else term.draw_text(mb.row + 1, mb.col + 1, msg);
  }
  term.show_cursor(false);
  term.move_cursor(rows - 1, 0);
  term.refresh();
}
