#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string>

#include "sensors/metric_source.hpp"

namespace hostpulse::sensors {

inline constexpr const char* kSysClassBlock = "/sys/class/block";

class DiskSensor {
 public:
  struct RawFields {
    std::uint64_t sectors_read{0};
    std::uint64_t sectors_written{0};
    std::uint64_t devices{0};
  };

  // /proc/diskstats always counts 512-byte sectors regardless of the
  // device's logical block size.
  static constexpr std::uint64_t kSectorBytes = 512;

  DiskSensor();
  explicit DiskSensor(std::FILE* diskstats, bool owns_file = false, std::string sys_class_block = kSysClassBlock);
  ~DiskSensor();

  DiskSensor(const DiskSensor&) = delete;
  DiskSensor& operator=(const DiskSensor&) = delete;

  bool sample(DiskIoCounters& counters) noexcept;
  const RawFields& raw() const noexcept;

 private:
  static constexpr std::size_t kReadBufferSize = 512;

  std::FILE* diskstats_{nullptr};
  bool owns_file_{true};
  std::string sys_class_block_{kSysClassBlock};
  RawFields raw_{};
};

// Name-only classification, used when sysfs has no entry for the device.
bool is_partition_device(const char* name) noexcept;

// A device listed under `sys_class_block` is a partition when its directory
// holds a `partition` attribute.
bool is_partition_device(const char* name, const std::string& sys_class_block) noexcept;

}  // namespace hostpulse::sensors
