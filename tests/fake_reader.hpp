#pragma once
/*
 * FakeReader
 *
 * Purpose: in-memory IReader for tests. Groups and 1-D datasets keyed by path;
 * counts list/read calls and throws ReadError for paths marked failing.
 * Shaped datasets hold no data: element i of the flattened array is i, and
 * get_values shows the first ROW_HEAD cells of each row, recording the window.
 */
#include <algorithm>
#include <cstdio>
#include <map>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include "i_reader.hpp"
#include "errors.hpp"

class FakeReader : public IReader {
public:
  struct Entry {
    NodeKind kind = NodeKind::Container;
    std::vector<double> data;
    std::vector<std::string> strings;
    std::vector<std::uint64_t> shape; // set for shaped datasets only
    bool numeric = true;
  };

  static constexpr std::uint64_t ROW_HEAD = 4;

  FakeReader() { add_group("/"); }

  void add_group(const std::string& path) { entries_[path] = Entry{}; }
  void add_dataset(const std::string& path, std::vector<double> data) {
    Entry e;
    e.kind = NodeKind::Leaf;
    e.data = std::move(data);
    entries_[path] = std::move(e);
  }
  void add_strings(const std::string& path, std::vector<std::string> strings) {
    Entry e;
    e.kind = NodeKind::Leaf;
    e.numeric = false;
    e.strings = std::move(strings);
    entries_[path] = std::move(e);
  }
  void add_shaped(const std::string& path, std::vector<std::uint64_t> shape) {
    Entry e;
    e.kind = NodeKind::Leaf;
    e.shape = std::move(shape);
    entries_[path] = std::move(e);
  }
  void set_attributes(const std::string& path, std::string text) { attrs_[path] = std::move(text); }
  void fail_on(const std::string& path) { failing_.insert(path); }
  void heal(const std::string& path) { failing_.erase(path); breaking_.erase(path); }
  // throws std::length_error instead of ReadError
  void break_on(const std::string& path) { breaking_.insert(path); }

  int list_calls = 0;
  int read_calls = 0;
  int metadata_calls = 0;
  std::uint64_t last_start = 0, last_end = 0;

  ChildInfo describe(const std::string& path) override {
    const Entry& e = entry(path);
    ChildInfo ci;
    ci.name = path == "/" ? "test.h5" : last(path);
    ci.kind = e.kind;
    ci.has_children = e.kind == NodeKind::Container && !children_of(path).empty();
    return ci;
  }

  std::vector<ChildInfo> list_children(const std::string& path) override {
    list_calls++;
    entry(path);
    std::vector<ChildInfo> out;
    for (const auto& p : children_of(path)) out.push_back(describe(p));
    return out;
  }

  std::string get_metadata(const std::string& path) override {
    metadata_calls++;
    const Entry& e = entry(path);
    return std::string(e.kind == NodeKind::Container ? "Group: " : "Dataset: ") + path;
  }

  std::string get_attributes(const std::string& path) override {
    entry(path);
    auto it = attrs_.find(path);
    return it == attrs_.end() ? "No attributes" : it->second;
  }

  std::string get_values(const std::string& path, std::optional<std::uint64_t> start, std::optional<std::uint64_t> end) override {
    const Entry& e = dataset(path);
    if (!e.shape.empty()) return shaped_values(e, start.value_or(0), end.value_or(e.shape[0]));
    std::uint64_t n = e.numeric ? e.data.size() : e.strings.size();
    std::uint64_t s = start.value_or(0);
    std::uint64_t en = end ? std::min<std::uint64_t>(*end, n) : std::min<std::uint64_t>(n, s + 1000);
    last_start = s;
    last_end = en;
    std::string out;
    for (std::uint64_t i = s; i < en; ++i) {
      if (i > s) out += '\n';
      out += e.numeric ? format(e.data[i]) : e.strings[i];
    }
    return out;
  }

  DatasetInfo dataset_info(const std::string& path) override {
    const Entry& e = dataset(path);
    DatasetInfo info;
    if (!e.shape.empty()) info.shape = e.shape;
    else info.shape = {e.numeric ? e.data.size() : e.strings.size()};
    info.dtype = e.numeric ? "float64" : "string (variable length)";
    info.numeric = e.numeric;
    return info;
  }

  std::vector<double> read_numeric(const std::string& path, std::uint64_t start, std::uint64_t end) override {
    read_calls++;
    const Entry& e = dataset(path);
    if (!e.numeric) throw ReadError(path + " is not numeric");
    if (!e.shape.empty()) throw ReadError(path + " holds no data");
    end = std::min<std::uint64_t>(end, e.data.size());
    if (start >= end) return {};
    return std::vector<double>(e.data.begin() + static_cast<std::ptrdiff_t>(start), e.data.begin() + static_cast<std::ptrdiff_t>(end));
  }

  static std::string format(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%g", v);
    return buf;
  }

private:
  std::string shaped_values(const Entry& e, std::uint64_t s, std::uint64_t en) {
    std::uint64_t row = 1;
    for (size_t i = 1; i < e.shape.size(); ++i) row *= e.shape[i];
    en = std::min(en, e.shape[0]);
    last_start = s;
    last_end = en;
    std::string out;
    for (std::uint64_t r = s; r < en; ++r) {
      if (r > s) out += '\n';
      out += '[';
      for (std::uint64_t k = 0; k < row && k < ROW_HEAD; ++k) {
        if (k) out += ", ";
        out += std::to_string(r * row + k);
      }
      if (row > ROW_HEAD) out += ", ...";
      out += ']';
    }
    return out;
  }

  const Entry& entry(const std::string& path) const {
    if (failing_.count(path)) throw ReadError("simulated failure on " + path);
    if (breaking_.count(path)) throw std::length_error("simulated oversized read on " + path);
    auto it = entries_.find(path);
    if (it == entries_.end()) throw ReadError("no such object " + path);
    return it->second;
  }
  const Entry& dataset(const std::string& path) const {
    const Entry& e = entry(path);
    if (e.kind != NodeKind::Leaf) throw ReadError(path + " is not a Dataset");
    return e;
  }
  static std::string last(const std::string& path) { return path.substr(path.find_last_of('/') + 1); }
  static std::string parent(const std::string& path) {
    size_t pos = path.find_last_of('/');
    return pos == 0 ? "/" : path.substr(0, pos);
  }
  std::vector<std::string> children_of(const std::string& path) const {
    std::vector<std::string> out;
    for (const auto& kv : entries_) {
      if (kv.first != "/" && parent(kv.first) == path) out.push_back(kv.first);
    }
    return out;
  }

  std::map<std::string, Entry> entries_;
  std::map<std::string, std::string> attrs_;
  std::set<std::string> failing_;
  std::set<std::string> breaking_;
};
