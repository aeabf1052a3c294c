#ifndef COMMON_H
#define COMMON_H

#include <fmt/core.h>

#include <cmath>
#include <numbers>
#include <string>

constexpr double DEG2RAD = std::numbers::pi / 180.0;
constexpr double RAD2DEG = 180.0 / std::numbers::pi;

template <typename T1, typename... TS>
auto with_formatting(const std::string &code, const T1 &first, TS... args)
  -> std::string {
    return code + fmt::format(fmt::runtime(fmt::format("{}", first)), args...)
           + "\033[0m";
}

template <typename... T>
auto bold(T... args) -> std::string {
    return with_formatting("\033[1m", args...);
}
template <typename... T>
auto red(T... args) -> std::string {
    return with_formatting("\033[31m", args...);
}

/// Format a duration in seconds the way the command-line tools report timings
inline auto format_seconds(double seconds) -> std::string {
    if (seconds < 1.0) {
        return fmt::format("{:.1f} ms", seconds * 1000.0);
    }
    return fmt::format("{:.3f} s", seconds);
}

#endif
