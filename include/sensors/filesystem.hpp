#pragma once

#include <string>

#include <sys/statvfs.h>

#include "sensors/metric_source.hpp"

namespace hostpulse::sensors {

class FilesystemSensor {
 public:
  bool sample(const std::string& path, FilesystemStats& stats) noexcept;

  // errno of the last failed sample, 0 otherwise.
  [[nodiscard]] int last_error() const noexcept;

  static FilesystemStats from_statvfs(const struct statvfs& stat) noexcept;

 private:
  int last_error_{0};
};

}  // namespace hostpulse::sensors
