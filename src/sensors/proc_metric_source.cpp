#include "sensors/proc_metric_source.hpp"

#include <cstring>
#include <thread>

#include "core/errors.hpp"

namespace hostpulse::sensors {

ProcMetricSource::ProcMetricSource(std::FILE* stat, std::FILE* meminfo, std::FILE* diskstats)
    : cpu_sensor_(stat, false), memory_sensor_(meminfo, false), disk_sensor_(diskstats, false) {}

double ProcMetricSource::cpu_percent(const std::chrono::milliseconds interval) {
  double busy_percent = 0.0;
  if (!cpu_sensor_.sample(busy_percent)) {
    throw core::MetricUnavailable("cpu: unable to read /proc/stat");
  }

  std::this_thread::sleep_for(interval);

  if (!cpu_sensor_.sample(busy_percent)) {
    throw core::MetricUnavailable("cpu: unable to read /proc/stat");
  }
  return busy_percent;
}

MemoryStats ProcMetricSource::memory_stats() {
  MemoryStats stats{};
  if (!memory_sensor_.sample(stats)) {
    throw core::MetricUnavailable("memory: unable to read MemTotal from /proc/meminfo");
  }
  return stats;
}

FilesystemStats ProcMetricSource::filesystem_stats(const std::string& path) {
  FilesystemStats stats{};
  if (!filesystem_sensor_.sample(path, stats)) {
    throw core::MetricUnavailable("filesystem: statvfs(" + path + ") failed: " +
                                  std::strerror(filesystem_sensor_.last_error()));
  }
  return stats;
}

DiskIoCounters ProcMetricSource::disk_io_counters() {
  DiskIoCounters counters{};
  if (!disk_sensor_.sample(counters)) {
    throw core::MetricUnavailable("disk io: unable to read /proc/diskstats");
  }
  return counters;
}

}  // namespace hostpulse::sensors
