#pragma once
/*
 * RunningStats
 *
 * Purpose: single-pass min/max/mean/std over chunks of a dataset (Welford);
 * non-finite samples are counted separately and left out of the moments.
 */
#include <cstdint>
#include <limits>
#include <vector>

struct RunningStats {
  std::uint64_t count = 0;
  std::uint64_t skipped = 0;
  double min = std::numeric_limits<double>::infinity();
  double max = -std::numeric_limits<double>::infinity();

  void add(double v);
  void add(const std::vector<double>& vs) { for (double v : vs) add(v); }
  double mean() const { return mean_; }
  double variance() const { return count ? m2_ / static_cast<double>(count) : 0.0; }
  double stddev() const;

private:
  double mean_ = 0.0;
  double m2_ = 0.0;
};
