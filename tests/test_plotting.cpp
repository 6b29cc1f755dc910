#include "plotting.hpp"
#include "stats.hpp"
#include "errors.hpp"
#include "test_util.hpp"
#include <algorithm>
#include <cassert>
#include <cmath>
#include <limits>
#include <numeric>
#include <string>
#include <vector>

static bool near(double a, double b) { return std::fabs(a - b) <= 1e-9 * std::max(1.0, std::fabs(b)); }

static int count_lines(const std::string& s) { return 1 + static_cast<int>(std::count(s.begin(), s.end(), '\n')); }

static void test_stats_chunks_match_single_pass() {
  std::vector<double> v;
  for (int i = 0; i < 1000; ++i) v.push_back(std::sin(i * 0.37) * 50.0 + i * 0.01);
  RunningStats whole;
  whole.add(v);
  RunningStats chunked;
  for (size_t s = 0; s < v.size(); s += 97) {
    std::vector<double> chunk(v.begin() + static_cast<std::ptrdiff_t>(s),
                              v.begin() + static_cast<std::ptrdiff_t>(std::min(v.size(), s + 97)));
    chunked.add(chunk);
  }
  assert(chunked.count == whole.count);
  assert(chunked.min == whole.min && chunked.max == whole.max);
  assert(near(chunked.mean(), whole.mean()));
  assert(near(chunked.stddev(), whole.stddev()));

  double mean = std::accumulate(v.begin(), v.end(), 0.0) / static_cast<double>(v.size());
  double ss = 0.0;
  for (double x : v) ss += (x - mean) * (x - mean);
  assert(near(whole.mean(), mean));
  assert(near(whole.variance(), ss / static_cast<double>(v.size())));
}

static void test_stats_skip_non_finite() {
  RunningStats s;
  s.add({1.0, std::numeric_limits<double>::quiet_NaN(), 3.0, std::numeric_limits<double>::infinity()});
  assert(s.count == 2);
  assert(s.skipped == 2);
  assert(s.min == 1.0 && s.max == 3.0);
  assert(near(s.mean(), 2.0));
  assert(near(s.stddev(), 1.0));
}

static void test_histogram_counts() {
  HistogramPlotter h(10);
  assert(!h.has_data());
  assert(h.config_text().find("<none>") != std::string::npos);
  std::vector<double> v;
  for (int i = 0; i < 100; ++i) v.push_back(i);
  v.push_back(std::numeric_limits<double>::quiet_NaN());
  h.set_data("/beta", v);
  double lo = 0, hi = 0;
  auto c = h.counts(&lo, &hi);
  assert(c.size() == 10);
  assert(std::accumulate(c.begin(), c.end(), std::uint64_t{0}) == 100);
  assert(lo == 0.0 && hi == 99.0);
  for (auto n : c) assert(n == 10);

  h.set_bins(7);
  c = h.counts();
  assert(c.size() == 7);
  assert(std::accumulate(c.begin(), c.end(), std::uint64_t{0}) == 100);

  // log x drops the zero
  h.toggle_log_x();
  c = h.counts();
  assert(std::accumulate(c.begin(), c.end(), std::uint64_t{0}) == 99);

  std::string out = h.render(60, 12);
  assert(count_lines(out) == 12);
  assert(out.rfind("/beta", 0) == 0);
  assert(out.find('#') != std::string::npos);

  h.reset();
  assert(!h.has_data());
  assert(!h.log_x());
}

static void test_density() {
  DensityPlotter d;
  assert(throws_as<InvalidUserInput>([&] { d.check(); }));
  d.set_x("/x", {1, 2, 3, 4});
  assert(d.has_data() && !d.ready());
  d.set_y("/y", {1, 4, 9});
  assert(throws_as<InvalidUserInput>([&] { d.render(40, 10); }));
  d.set_y("/y", {1, 4, 9, 16});
  d.check();
  std::string out = d.render(40, 10);
  assert(count_lines(out) == 10);
  assert(out.rfind("/y vs /x  N=4", 0) == 0);
  assert(out.find('@') != std::string::npos);
  d.reset();
  assert(!d.has_data());
}

int main() {
  test_stats_chunks_match_single_pass();
  test_stats_skip_non_finite();
  test_histogram_counts();
  test_density();
  return 0;
}
