#pragma once
#include <string>
#include "fake_reader.hpp"

template <typename E, typename F>
static bool throws_as(F&& f) {
  try {
    f();
  } catch (const E&) {
    return true;
  }
  return false;
}

// "/" -> alpha (group: x), beta (dataset 0..9)
inline void fill_sample(FakeReader& r) {
  r.add_group("/alpha");
  r.add_dataset("/alpha/x", {1.0, 2.0, 3.0});
  std::vector<double> beta;
  for (int i = 0; i < 10; ++i) beta.push_back(i);
  r.add_dataset("/beta", beta);
}
