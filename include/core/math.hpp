#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace hostpulse::core {

inline constexpr double clamp_percent(const double value) noexcept {
  return std::clamp(value, 0.0, 100.0);
}

inline double round_one_decimal(const double value) noexcept {
  return std::round(value * 10.0) / 10.0;
}

inline double ratio_percent(const std::uint64_t part, const std::uint64_t whole) noexcept {
  if (whole == 0) {
    return 0.0;
  }
  return clamp_percent((static_cast<double>(part) / static_cast<double>(whole)) * 100.0);
}

}  // namespace hostpulse::core
