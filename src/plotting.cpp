#include "plotting.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

static bool usable(double v, bool log) { return std::isfinite(v) && (!log || v > 0.0); }
static double axis_value(double v, bool log) { return log ? std::log10(v) : v; }
static double from_axis(double t, bool log) { return log ? std::pow(10.0, t) : t; }

static std::string num(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.4g", v);
  return buf;
}

static std::string pad_left(const std::string& s, int w) {
  if ((int)s.size() >= w) return s.substr(0, static_cast<size_t>(w));
  return std::string(static_cast<size_t>(w - (int)s.size()), ' ') + s;
}

// "lo ...... hi" spread across width columns, starting after the label gutter
static std::string range_line(double lo, double hi, int gutter, int width) {
  std::string left = num(lo), right = num(hi);
  std::string s(static_cast<size_t>(gutter + 1), ' ');
  s += left;
  int fill = width - (int)left.size() - (int)right.size();
  s += std::string(static_cast<size_t>(std::max(1, fill)), ' ');
  s += right;
  return s;
}

static std::string join_lines(const std::vector<std::string>& lines) {
  std::string out;
  for (size_t i = 0; i < lines.size(); ++i) {
    if (i) out += '\n';
    out += lines[i];
  }
  return out;
}

void HistogramPlotter::set_data(std::string path, std::vector<double> values) {
  path_ = std::move(path);
  values_ = std::move(values);
}

void HistogramPlotter::reset() {
  path_.clear();
  values_.clear();
  log_x_ = false;
  log_y_ = false;
}

std::vector<std::uint64_t> HistogramPlotter::counts(double* lo, double* hi) const {
  std::vector<std::uint64_t> c(static_cast<size_t>(std::max(1, bins_)), 0);
  double a = INFINITY, b = -INFINITY;
  for (double v : values_) {
    if (!usable(v, log_x_)) continue;
    double t = axis_value(v, log_x_);
    a = std::min(a, t);
    b = std::max(b, t);
  }
  if (a > b) return c;
  double span = (b > a) ? b - a : 1.0;
  int n = static_cast<int>(c.size());
  for (double v : values_) {
    if (!usable(v, log_x_)) continue;
    int k = static_cast<int>((axis_value(v, log_x_) - a) / span * n);
    c[static_cast<size_t>(std::clamp(k, 0, n - 1))]++;
  }
  if (lo) *lo = a;
  if (hi) *hi = b;
  return c;
}

std::string HistogramPlotter::config_text() const {
  std::string s;
  s += "Data:     " + (path_.empty() ? std::string("<none>") : path_) + "\n";
  s += "Bins:     " + std::to_string(bins_) + "\n";
  s += std::string("x-scale:  ") + (log_x_ ? "log" : "linear") + "\n";
  s += std::string("y-scale:  ") + (log_y_ ? "log" : "linear");
  if (!path_.empty()) s += "\nSamples:  " + std::to_string(values_.size());
  return s;
}

std::string HistogramPlotter::render(int width, int height) const {
  if (!has_data()) return config_text();
  double lo = 0.0, hi = 0.0;
  std::vector<std::uint64_t> c = counts(&lo, &hi);
  std::uint64_t total = 0;
  for (auto v : c) total += v;
  std::vector<std::string> lines;
  lines.push_back(path_ + "  N=" + std::to_string(total) + "  bins=" + std::to_string(bins_) +
                  (log_x_ ? "  log-x" : "") + (log_y_ ? "  log-y" : ""));
  if (total == 0) {
    lines.push_back("no finite samples to plot");
    return join_lines(lines);
  }
  const int gutter = 8;
  int plot_w = std::max(1, width - gutter - 1);
  int plot_h = std::max(1, height - 2);
  size_t nb = c.size();
  std::vector<double> col(static_cast<size_t>(plot_w), 0.0);
  for (int x = 0; x < plot_w; ++x) {
    size_t b0 = static_cast<size_t>(x) * nb / static_cast<size_t>(plot_w);
    size_t b1 = std::max(b0 + 1, static_cast<size_t>(x + 1) * nb / static_cast<size_t>(plot_w));
    double sum = 0.0;
    for (size_t b = b0; b < b1 && b < nb; ++b) sum += static_cast<double>(c[b]);
    col[static_cast<size_t>(x)] = log_y_ ? std::log10(1.0 + sum) : sum;
  }
  double top = *std::max_element(col.begin(), col.end());
  if (top <= 0.0) top = 1.0;
  double raw_top = log_y_ ? std::pow(10.0, top) - 1.0 : top;
  for (int r = 0; r < plot_h; ++r) {
    int level = plot_h - r;
    std::string label = (r == 0) ? num(raw_top) : (r == plot_h - 1 ? std::string("0") : std::string());
    std::string row = pad_left(label, gutter) + "|";
    for (int x = 0; x < plot_w; ++x) {
      double filled = col[static_cast<size_t>(x)] / top * plot_h;
      row += (filled >= level - 0.5) ? '#' : ' ';
    }
    lines.push_back(row);
  }
  lines.push_back(range_line(from_axis(lo, log_x_), from_axis(hi, log_x_), gutter, plot_w));
  return join_lines(lines);
}

void DensityPlotter::reset() {
  x_path_.clear();
  y_path_.clear();
  x_.clear();
  y_.clear();
  log_x_ = false;
  log_y_ = false;
}

std::string DensityPlotter::config_text() const {
  std::string s;
  s += "x-axis:   " + (x_path_.empty() ? std::string("<none>") : x_path_) + "\n";
  s += "y-axis:   " + (y_path_.empty() ? std::string("<none>") : y_path_) + "\n";
  s += std::string("x-scale:  ") + (log_x_ ? "log" : "linear") + "\n";
  s += std::string("y-scale:  ") + (log_y_ ? "log" : "linear");
  return s;
}

void DensityPlotter::check() const {
  if (!ready()) throw InvalidUserInput("select both an x-axis and a y-axis dataset first");
  if (x_.size() != y_.size()) {
    throw InvalidUserInput("x-axis has " + std::to_string(x_.size()) + " elements, y-axis has " +
                           std::to_string(y_.size()));
  }
}

std::string DensityPlotter::render(int width, int height) const {
  check();
  double xlo = INFINITY, xhi = -INFINITY, ylo = INFINITY, yhi = -INFINITY;
  std::uint64_t npoints = 0;
  for (size_t i = 0; i < x_.size(); ++i) {
    if (!usable(x_[i], log_x_) || !usable(y_[i], log_y_)) continue;
    double ax = axis_value(x_[i], log_x_), ay = axis_value(y_[i], log_y_);
    xlo = std::min(xlo, ax); xhi = std::max(xhi, ax);
    ylo = std::min(ylo, ay); yhi = std::max(yhi, ay);
    npoints++;
  }
  std::vector<std::string> lines;
  lines.push_back(y_path_ + " vs " + x_path_ + "  N=" + std::to_string(npoints));
  if (npoints == 0) {
    lines.push_back("no finite points to plot");
    return join_lines(lines);
  }
  const int gutter = 9;
  int plot_w = std::max(1, width - gutter - 1);
  int plot_h = std::max(1, height - 2);
  double xspan = (xhi > xlo) ? xhi - xlo : 1.0;
  double yspan = (yhi > ylo) ? yhi - ylo : 1.0;
  std::vector<std::uint64_t> grid(static_cast<size_t>(plot_w) * static_cast<size_t>(plot_h), 0);
  for (size_t i = 0; i < x_.size(); ++i) {
    if (!usable(x_[i], log_x_) || !usable(y_[i], log_y_)) continue;
    int xi = std::clamp(static_cast<int>((axis_value(x_[i], log_x_) - xlo) / xspan * plot_w), 0, plot_w - 1);
    int yi = std::clamp(static_cast<int>((axis_value(y_[i], log_y_) - ylo) / yspan * plot_h), 0, plot_h - 1);
    grid[static_cast<size_t>(plot_h - 1 - yi) * static_cast<size_t>(plot_w) + static_cast<size_t>(xi)]++;
  }
  static const char shades[] = " .:-=+*#%@";
  const int nshades = 9;
  std::uint64_t maxc = *std::max_element(grid.begin(), grid.end());
  for (int r = 0; r < plot_h; ++r) {
    std::string label;
    if (r == 0) label = num(from_axis(yhi, log_y_));
    else if (r == plot_h - 1) label = num(from_axis(ylo, log_y_));
    std::string row = pad_left(label, gutter) + "|";
    for (int x = 0; x < plot_w; ++x) {
      std::uint64_t n = grid[static_cast<size_t>(r) * static_cast<size_t>(plot_w) + static_cast<size_t>(x)];
      int level = 0;
      if (n > 0) {
        level = maxc <= 1 ? nshades
                          : 1 + static_cast<int>(std::log(static_cast<double>(n)) / std::log(static_cast<double>(maxc)) * (nshades - 1));
      }
      row += shades[std::clamp(level, 0, nshades)];
    }
    lines.push_back(row);
  }
  lines.push_back(range_line(from_axis(xlo, log_x_), from_axis(xhi, log_x_), gutter, plot_w));
  return join_lines(lines);
}
