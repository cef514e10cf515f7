#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include <fmt/format.h>

inline std::string format_ratio(uint64_t done, uint64_t total) {
  return fmt::format("{}/{}", done, total);
}

template<typename Rep, typename Period>
std::string format_elapsed(std::chrono::duration<Rep, Period> elapsed) {
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count();

  if (millis < 1000) {
    return fmt::format("{}ms", millis);
  }

  auto seconds = millis / 1000;

  if (seconds < 60) {
    return fmt::format("{}.{:03}s", seconds, millis % 1000);
  }

  return fmt::format("{}m{:02}s", seconds / 60, seconds % 60);
}
