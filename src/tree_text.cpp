#include "tree_text.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <iterator>

TreeText::TreeText(NodeStore& store) : store_(store) {}

std::string TreeText::render_line(const Node& node) {
  std::string s(static_cast<size_t>(node.depth) * 4, ' ');
  if (node.is_container()) s += node.is_expanded ? "v " : "> ";
  else s += "  ";
  s += node.name;
  return s;
}

void TreeText::initialize(NodeId root) {
  lines_.clear();
  line_index_.clear();
  lines_.push_back(render_line(store_.at(root)));
  line_index_.push_back(root);
  length_ = lines_[0].size();
}

void TreeText::check_row(NodeId id, int row) const {
  if (row < 0 || row >= row_count() || line_index_[row] != id) {
    throw IndexOutOfRange("row " + std::to_string(row) + " does not show " + store_.at(id).path);
  }
}

void TreeText::replace_line(int row, std::string s) {
  length_ -= lines_[row].size();
  length_ += s.size();
  lines_[row] = std::move(s);
}

void TreeText::expand_node(NodeId id, int row) {
  {
    const Node& node = store_.at(id);
    if (!node.is_container() || !node.has_children || node.is_expanded) return;
  }
  check_row(id, row);
  const std::vector<NodeId> children = store_.expand(id);
  std::vector<std::string> rendered;
  rendered.reserve(children.size());
  std::size_t added = 0;
  for (NodeId c : children) {
    rendered.push_back(render_line(store_.at(c)));
    added += rendered.back().size() + 1;
  }
  auto pos = static_cast<std::ptrdiff_t>(row) + 1;
  lines_.insert(lines_.begin() + pos, std::make_move_iterator(rendered.begin()), std::make_move_iterator(rendered.end()));
  line_index_.insert(line_index_.begin() + pos, children.begin(), children.end());
  length_ += added;
  store_.at(id).is_expanded = true;
  replace_line(row, render_line(store_.at(id)));
}

void TreeText::collapse_node(NodeId id, int row) {
  if (!store_.at(id).is_expanded) return;
  check_row(id, row);
  int depth = store_.at(id).depth;
  int end = row + 1;
  std::size_t removed = 0;
  while (end < row_count() && store_.at(line_index_[end]).depth > depth) {
    // hidden descendants come back collapsed on the next expansion
    store_.at(line_index_[end]).is_expanded = false;
    removed += lines_[end].size() + 1;
    end++;
  }
  lines_.erase(lines_.begin() + row + 1, lines_.begin() + end);
  line_index_.erase(line_index_.begin() + row + 1, line_index_.begin() + end);
  length_ -= removed;
  store_.at(id).is_expanded = false;
  replace_line(row, render_line(store_.at(id)));
  spdlog::debug("collapsed {} ({} rows hidden)", store_.at(id).path, end - row - 1);
}

NodeId TreeText::node_at_row(int row) const {
  if (row < 0 || row >= row_count()) {
    throw IndexOutOfRange("row " + std::to_string(row) + " outside 0.." + std::to_string(row_count() - 1));
  }
  return line_index_[row];
}

int TreeText::line_length(int row) const {
  if (row < 0 || row >= row_count()) return 0;
  return static_cast<int>(lines_[row].size());
}

const std::string& TreeText::line(int row) const {
  if (row < 0 || row >= row_count()) throw IndexOutOfRange("row " + std::to_string(row) + " outside tree");
  return lines_[row];
}

std::string TreeText::text() const {
  std::string out;
  out.reserve(length_);
  for (size_t i = 0; i < lines_.size(); ++i) {
    if (i) out += '\n';
    out += lines_[i];
  }
  return out;
}

int TreeText::row_of_node(NodeId id) const {
  for (int r = 0; r < row_count(); ++r) if (line_index_[r] == id) return r;
  return -1;
}
