#pragma once
/*
 * IReader
 *
 * Purpose: abstract read-only access to a hierarchical data file
 * (enumerate children, describe nodes, format metadata/attributes/values).
 * Goal: decouple the tree model from HDF5 so it can be tested with a fake.
 * Errors: every call may throw ReadError.
 */
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"

struct ChildInfo {
  std::string name;
  NodeKind kind = NodeKind::Leaf;
  bool has_children = false;
};

struct DatasetInfo {
  std::vector<std::uint64_t> shape; // empty for scalars
  std::string dtype;
  bool numeric = false;

  std::uint64_t length() const { return shape.empty() ? 1 : shape[0]; }
  std::uint64_t row_size() const {
    std::uint64_t n = 1;
    for (size_t i = 1; i < shape.size(); ++i) n *= shape[i];
    return n;
  }
};

class IReader {
public:
  virtual ~IReader() = default;
  virtual ChildInfo describe(const std::string& path) = 0;
  virtual std::vector<ChildInfo> list_children(const std::string& path) = 0;
  virtual std::string get_metadata(const std::string& path) = 0;
  virtual std::string get_attributes(const std::string& path) = 0;
  // one element per line along the first axis; absent bounds mean a capped window from the start
  virtual std::string get_values(const std::string& path, std::optional<std::uint64_t> start, std::optional<std::uint64_t> end) = 0;
  virtual DatasetInfo dataset_info(const std::string& path) = 0;
  // rows [start, end) of the first axis, flattened
  virtual std::vector<double> read_numeric(const std::string& path, std::uint64_t start, std::uint64_t end) = 0;
};

inline std::string join_path(const std::string& parent, const std::string& name) {
  if (parent.empty() || parent == "/") return "/" + name;
  return parent + "/" + name;
}
