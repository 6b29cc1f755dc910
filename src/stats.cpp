#include "stats.hpp"
#include <cmath>

void RunningStats::add(double v) {
  if (!std::isfinite(v)) { skipped++; return; }
  count++;
  if (v < min) min = v;
  if (v > max) max = v;
  double delta = v - mean_;
  mean_ += delta / static_cast<double>(count);
  m2_ += delta * (v - mean_);
}

double RunningStats::stddev() const { return std::sqrt(variance()); }
