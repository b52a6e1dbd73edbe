#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace hostpulse::sensors {

struct MemoryStats {
  std::uint64_t total{0};
  std::uint64_t available{0};
  std::uint64_t used{0};
  double percent{0.0};
};

struct FilesystemStats {
  std::uint64_t total{0};
  std::uint64_t used{0};
  std::uint64_t free{0};
  double percent{0.0};
};

struct DiskIoCounters {
  std::uint64_t read_bytes{0};
  std::uint64_t write_bytes{0};
};

// Host OS accounting interfaces. Every operation throws
// core::MetricUnavailable when the OS cannot service the query.
class MetricSource {
 public:
  virtual ~MetricSource() = default;

  // Blocks for the whole interval.
  virtual double cpu_percent(std::chrono::milliseconds interval) = 0;
  virtual MemoryStats memory_stats() = 0;
  virtual FilesystemStats filesystem_stats(const std::string& path) = 0;
  virtual DiskIoCounters disk_io_counters() = 0;
};

}  // namespace hostpulse::sensors
