#include "sensors/filesystem.hpp"

#include <cerrno>
#include <cstdint>

#include "core/math.hpp"

namespace hostpulse::sensors {

bool FilesystemSensor::sample(const std::string& path, FilesystemStats& stats) noexcept {
  stats = {};
  last_error_ = 0;

  if (path.empty()) {
    last_error_ = ENOENT;
    return false;
  }

  struct statvfs stat {};
  if (statvfs(path.c_str(), &stat) != 0) {
    last_error_ = errno;
    return false;
  }

  stats = from_statvfs(stat);
  if (stats.total == 0) {
    // pseudo filesystems (proc, sysfs) report no blocks
    last_error_ = ENODATA;
    return false;
  }
  return true;
}

int FilesystemSensor::last_error() const noexcept { return last_error_; }

FilesystemStats FilesystemSensor::from_statvfs(const struct statvfs& stat) noexcept {
  const auto fragment = static_cast<std::uint64_t>(stat.f_frsize);
  const auto blocks = static_cast<std::uint64_t>(stat.f_blocks);
  const auto blocks_free = static_cast<std::uint64_t>(stat.f_bfree);
  const auto blocks_avail = static_cast<std::uint64_t>(stat.f_bavail);

  FilesystemStats stats{};
  stats.total = blocks * fragment;
  stats.free = blocks_avail * fragment;
  stats.used = blocks >= blocks_free ? (blocks - blocks_free) * fragment : 0;

  // Root-reserved blocks count as neither used nor free for the percentage.
  stats.percent = core::ratio_percent(stats.used, stats.used + stats.free);
  return stats;
}

}  // namespace hostpulse::sensors
