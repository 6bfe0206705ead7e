#pragma once

#include <cstdlib>
#include <utility>

#include <fmt/core.h>

namespace basalt::core {

/**
 * \brief Whether `BASALT_BENCH_MODE` is set.
 *
 * Benchmarks and tests set it to keep stdout free of status lines.
 * \return `true` when status logging is suppressed.
 */
inline bool bench_mode_from_env() { return std::getenv("BASALT_BENCH_MODE") != nullptr; }

/**
 * \brief Print one status line unless bench mode is active.
 * \param format fmt format string, conventionally starting with a `[Tag]`.
 * \param args Format arguments.
 */
template <typename... Args>
void log_status(fmt::format_string<Args...> format, Args &&...args) {
  if (bench_mode_from_env()) {
    return;
  }
  fmt::print("{}\n", fmt::format(format, std::forward<Args>(args)...));
}

} // namespace basalt::core
