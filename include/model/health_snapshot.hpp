#pragma once

#include <cstdint>
#include <string>

namespace hostpulse::model {

inline constexpr const char* kStatusHealthy = "healthy";

// One point-in-time record of host metrics. Byte counts are absolute,
// percentages are in [0, 100] rounded to one decimal.
struct HealthSnapshot {
  std::string status{kStatusHealthy};
  double cpu_usage{0.0};

  std::uint64_t memory_total{0};
  std::uint64_t memory_available{0};
  std::uint64_t memory_used{0};
  double memory_percent{0.0};

  std::uint64_t disk_total{0};
  std::uint64_t disk_used{0};
  std::uint64_t disk_free{0};
  double disk_percent{0.0};

  std::uint64_t disk_read_bytes{0};
  std::uint64_t disk_write_bytes{0};
};

}  // namespace hostpulse::model
