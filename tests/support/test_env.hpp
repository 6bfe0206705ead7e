#pragma once

#include <cstdlib>
#include <string>

namespace basalt::test_support {

inline void configure_deterministic_test_env() {
  setenv("BASALT_BACKEND", "cpu", 1);
  setenv("BASALT_NUM_THREADS", "1", 1);
  setenv("BASALT_BENCH_MODE", "1", 1);
}

inline void configure_parallel_test_env(int threads) {
  setenv("BASALT_BACKEND", "parallel", 1);
  setenv("BASALT_NUM_THREADS", std::to_string(threads).c_str(), 1);
  setenv("BASALT_BENCH_MODE", "1", 1);
}

} // namespace basalt::test_support
