#pragma once
/*
 * TreeText
 *
 * Purpose: the displayed outline of the hierarchy, one line per visible Node,
 * plus the row → NodeId index kept parallel to the lines.
 * Invariant: line_index.size() == lines.size() after every call; an expanded
 * Container's descendants follow its row contiguously, in pre-order.
 * Cost: expand/collapse touch only the spliced rows; total_length() is cached.
 */
#include <cstddef>
#include <string>
#include <vector>
#include "types.hpp"
#include "node.hpp"

class TreeText {
public:
  explicit TreeText(NodeStore& store);

  void initialize(NodeId root);
  // silent no-op unless the node is a collapsed Container with children
  void expand_node(NodeId id, int row);
  // silent no-op unless the node is expanded
  void collapse_node(NodeId id, int row);

  NodeId node_at_row(int row) const;
  int row_count() const { return static_cast<int>(line_index_.size()); }
  int line_length(int row) const;
  std::size_t total_length() const { return length_; }
  const std::string& line(int row) const;
  std::string text() const;
  int row_of_node(NodeId id) const;

  static std::string render_line(const Node& node);

private:
  void check_row(NodeId id, int row) const;
  void replace_line(int row, std::string s);

  NodeStore& store_;
  std::vector<std::string> lines_;
  std::vector<NodeId> line_index_;
  std::size_t length_ = 0;
};
