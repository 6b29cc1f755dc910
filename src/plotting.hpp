#pragma once
/*
 * Plotters
 *
 * Purpose: text-art plots of already-fetched numeric arrays.
 * HistogramPlotter: one dataset, configurable bins, optional log axes.
 * DensityPlotter: two equal-length datasets binned onto the character grid.
 * Both render into a width x height block of lines for the plot panes.
 */
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

class HistogramPlotter {
public:
  explicit HistogramPlotter(int bins) : bins_(bins) {}
  void set_data(std::string path, std::vector<double> values);
  void set_bins(int bins) { bins_ = bins; }
  int bins() const { return bins_; }
  void toggle_log_x() { log_x_ = !log_x_; }
  void toggle_log_y() { log_y_ = !log_y_; }
  bool log_x() const { return log_x_; }
  bool log_y() const { return log_y_; }
  const std::string& path() const { return path_; }
  bool has_data() const { return !path_.empty(); }
  void reset();

  // counts per bin over the finite samples (positive ones when log_x)
  std::vector<std::uint64_t> counts(double* lo = nullptr, double* hi = nullptr) const;
  std::string config_text() const;
  std::string render(int width, int height) const;

private:
  std::string path_;
  std::vector<double> values_;
  int bins_;
  bool log_x_ = false;
  bool log_y_ = false;
};

class DensityPlotter {
public:
  void set_x(std::string path, std::vector<double> values) { x_path_ = std::move(path); x_ = std::move(values); }
  void set_y(std::string path, std::vector<double> values) { y_path_ = std::move(path); y_ = std::move(values); }
  void toggle_log_x() { log_x_ = !log_x_; }
  void toggle_log_y() { log_y_ = !log_y_; }
  bool has_data() const { return !x_path_.empty() || !y_path_.empty(); }
  bool ready() const { return !x_path_.empty() && !y_path_.empty(); }
  void reset();

  std::string config_text() const;
  // throws InvalidUserInput when the axes are missing or differ in length
  void check() const;
  std::string render(int width, int height) const;

private:
  std::string x_path_, y_path_;
  std::vector<double> x_, y_;
  bool log_x_ = false;
  bool log_y_ = false;
};
