#pragma once

#include <yamlet.hh>

#include <algorithm>
#include <cassert>
#include <cmath>
#include <cstdlib>
#include <iostream>
#include <string>

namespace yamlet_test {

// Runs `f` and returns the exception of type E it throws; any other outcome fails the test
template <typename E, typename F> E expect_error(F &&f, const char *what) {
  try {
    f();
  } catch (const E &e) {
    return e;
  }
  std::cerr << "❌ Expected an exception from: " << what << std::endl;
  std::abort();
}

inline bool contains(const std::string &text, const std::string &part) { return text.find(part) != std::string::npos; }

inline bool near(double a, double b) { return std::fabs(a - b) <= 1e-9 * std::max(1.0, std::fabs(b)); }

} // namespace yamlet_test
