#include "node.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

NodeStore::NodeStore(IReader& reader, std::size_t values_cap)
    : reader_(reader), values_cap_(values_cap) {}

NodeId NodeStore::create_root() {
  ChildInfo info = reader_.describe("/");
  Node root;
  root.path = "/";
  root.name = info.name;
  root.kind = info.kind;
  root.has_children = info.has_children;
  nodes_.push_back(std::move(root));
  return nodes_.size() - 1;
}

const std::vector<NodeId>& NodeStore::expand(NodeId id) {
  if (nodes_.at(id).children) return *nodes_[id].children;
  std::vector<ChildInfo> listing = reader_.list_children(nodes_[id].path);
  std::vector<NodeId> ids;
  ids.reserve(listing.size());
  nodes_.reserve(nodes_.size() + listing.size());
  for (auto& ci : listing) {
    Node child;
    child.path = join_path(nodes_[id].path, ci.name);
    child.name = std::move(ci.name);
    child.kind = ci.kind;
    child.has_children = ci.kind == NodeKind::Container && ci.has_children;
    child.depth = nodes_[id].depth + 1;
    child.parent = id;
    nodes_.push_back(std::move(child));
    ids.push_back(nodes_.size() - 1);
  }
  spdlog::debug("expanded {} ({} children)", nodes_[id].path, ids.size());
  nodes_[id].children = std::move(ids);
  return *nodes_[id].children;
}

std::string NodeStore::metadata_text(NodeId id) { return reader_.get_metadata(at(id).path); }

std::string NodeStore::attribute_text(NodeId id) { return reader_.get_attributes(at(id).path); }

std::string NodeStore::value_text(NodeId id, std::optional<IndexRange> range) {
  const Node& node = at(id);
  if (node.is_container()) throw InvalidUserInput(node.path + " is not a Dataset");
  DatasetInfo info = reader_.dataset_info(node.path);
  std::uint64_t n = info.length();
  std::uint64_t start = 0, end = n;
  if (range) {
    if (range->end <= range->start) throw InvalidUserInput("empty range");
    if (range->start >= n) {
      throw InvalidUserInput("start index " + std::to_string(range->start) +
                             " out of bounds for length " + std::to_string(n));
    }
    start = range->start;
    end = std::min<std::uint64_t>(range->end, n);
  }
  // the cap counts elements, so wide rows shrink the window; at least one row is shown
  std::uint64_t row_size = std::max<std::uint64_t>(1, info.row_size());
  std::uint64_t max_rows = std::max<std::uint64_t>(1, values_cap_ / row_size);
  std::uint64_t requested = end - start;
  bool truncated = requested > max_rows;
  if (truncated) end = start + max_rows;
  std::string text = reader_.get_values(node.path, start, end);
  if (truncated) {
    if (row_size == 1) {
      text += "\n... truncated to " + std::to_string(end - start) + " of " + std::to_string(requested) + " elements";
    } else {
      text += "\n... truncated to " + std::to_string(end - start) + " of " + std::to_string(requested) +
              " rows (" + std::to_string(row_size) + " elements per row)";
    }
  }
  return text;
}
