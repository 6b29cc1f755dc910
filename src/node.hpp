#pragma once
/*
 * Node / NodeStore
 *
 * Purpose: lazily-populated description of the hierarchy. The store is an arena:
 * it owns every Node, NodeId is an index into it and nothing is freed before the
 * session ends, so collapse/re-expand never re-reads children.
 */
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"
#include "i_reader.hpp"

struct Node {
  std::string path;
  std::string name;
  NodeKind kind = NodeKind::Leaf;
  bool has_children = false;
  bool is_expanded = false;
  int depth = 0;
  NodeId parent = NO_NODE;
  std::optional<std::vector<NodeId>> children; // empty optional until first expansion

  bool is_container() const { return kind == NodeKind::Container; }
};

class NodeStore {
public:
  NodeStore(IReader& reader, std::size_t values_cap);

  NodeId create_root();
  Node& at(NodeId id) { return nodes_.at(id); }
  const Node& at(NodeId id) const { return nodes_.at(id); }
  std::size_t size() const { return nodes_.size(); }
  IReader& reader() { return reader_; }
  std::size_t values_cap() const { return values_cap_; }
  void set_values_cap(std::size_t cap) { values_cap_ = cap; }

  // cached after the first call; ReadError leaves the node untouched
  const std::vector<NodeId>& expand(NodeId id);
  std::string metadata_text(NodeId id);
  std::string attribute_text(NodeId id);
  std::string value_text(NodeId id, std::optional<IndexRange> range = std::nullopt);

private:
  IReader& reader_;
  std::size_t values_cap_;
  std::vector<Node> nodes_;
};
