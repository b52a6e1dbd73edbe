#pragma once

#include <chrono>
#include <cstdio>
#include <string>

#include "sensors/cpu.hpp"
#include "sensors/disk.hpp"
#include "sensors/filesystem.hpp"
#include "sensors/memory.hpp"
#include "sensors/metric_source.hpp"

namespace hostpulse::sensors {

// Linux MetricSource backed by /proc and statvfs(2). The /proc handles are
// opened on construction and closed with the object.
class ProcMetricSource final : public MetricSource {
 public:
  ProcMetricSource() = default;

  // Borrowed handles; the caller keeps ownership.
  ProcMetricSource(std::FILE* stat, std::FILE* meminfo, std::FILE* diskstats);

  double cpu_percent(std::chrono::milliseconds interval) override;
  MemoryStats memory_stats() override;
  FilesystemStats filesystem_stats(const std::string& path) override;
  DiskIoCounters disk_io_counters() override;

 private:
  CpuSensor cpu_sensor_{};
  MemorySensor memory_sensor_{};
  FilesystemSensor filesystem_sensor_{};
  DiskSensor disk_sensor_{};
};

}  // namespace hostpulse::sensors
