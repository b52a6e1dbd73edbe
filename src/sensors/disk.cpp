#include "sensors/disk.hpp"

#include <cctype>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

namespace hostpulse::sensors {

namespace {

// Whole devices whose names end in an instance number. Their partitions use
// a `p<N>` suffix (md0p1, nbd0p2, nvme0n1p1).
constexpr const char* kNumberedDevicePrefixes[] = {"nvme", "mmcblk", "md", "nbd", "zram", "sr", "dm-", "rbd"};

bool has_numbered_prefix(const char* name) noexcept {
  for (const char* prefix : kNumberedDevicePrefixes) {
    if (std::strncmp(name, prefix, std::strlen(prefix)) == 0) {
      return true;
    }
  }
  return false;
}

}  // namespace

bool is_partition_device(const char* name) noexcept {
  const std::size_t len = std::strlen(name);
  std::size_t digit_start = len;

  while (digit_start > 0 && std::isdigit(static_cast<unsigned char>(name[digit_start - 1])) != 0) {
    --digit_start;
  }

  if (digit_start == len || digit_start == 0) {
    return false;
  }

  // nvme0n1p2, mmcblk0p1, md0p1
  const char marker = name[digit_start - 1];
  if (marker == 'p' && digit_start > 1 &&
      std::isdigit(static_cast<unsigned char>(name[digit_start - 2])) != 0) {
    return true;
  }

  if (has_numbered_prefix(name)) {
    return false;
  }

  // sda1, vdb3, xvda1
  return std::isalpha(static_cast<unsigned char>(marker)) != 0;
}

bool is_partition_device(const char* name, const std::string& sys_class_block) noexcept {
  std::error_code ec;
  const std::filesystem::path device = std::filesystem::path(sys_class_block) / name;
  if (!std::filesystem::exists(device, ec)) {
    return is_partition_device(name);
  }

  const bool partition = std::filesystem::exists(device / "partition", ec);
  if (ec) {
    return is_partition_device(name);
  }
  return partition;
}

DiskSensor::DiskSensor() : diskstats_(std::fopen("/proc/diskstats", "r")) {}

DiskSensor::DiskSensor(std::FILE* diskstats, const bool owns_file, std::string sys_class_block)
    : diskstats_(diskstats), owns_file_(owns_file), sys_class_block_(std::move(sys_class_block)) {}

DiskSensor::~DiskSensor() {
  if (owns_file_ && diskstats_ != nullptr) {
    std::fclose(diskstats_);
    diskstats_ = nullptr;
  }
}

bool DiskSensor::sample(DiskIoCounters& counters) noexcept {
  counters = {};
  if (diskstats_ == nullptr) {
    return false;
  }

  if (std::fseek(diskstats_, 0L, SEEK_SET) != 0) {
    return false;
  }

  raw_ = {};

  char buffer[kReadBufferSize]{};
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), diskstats_) != nullptr) {
    unsigned int major = 0;
    unsigned int minor = 0;
    char name[64]{};
    unsigned long long reads_completed = 0;
    unsigned long long reads_merged = 0;
    unsigned long long sectors_read = 0;
    unsigned long long ms_reading = 0;
    unsigned long long writes_completed = 0;
    unsigned long long writes_merged = 0;
    unsigned long long sectors_written = 0;

    const int parsed = std::sscanf(
        buffer,
        "%u %u %63s %llu %llu %llu %llu %llu %llu %llu",
        &major,
        &minor,
        name,
        &reads_completed,
        &reads_merged,
        &sectors_read,
        &ms_reading,
        &writes_completed,
        &writes_merged,
        &sectors_written);

    if (parsed < 10) {
      continue;
    }

    if (std::strncmp(name, "loop", 4) == 0 || std::strncmp(name, "ram", 3) == 0) {
      continue;
    }

    if (is_partition_device(name, sys_class_block_)) {
      continue;
    }

    raw_.sectors_read += sectors_read;
    raw_.sectors_written += sectors_written;
    ++raw_.devices;
  }

  if (std::ferror(diskstats_) != 0) {
    std::clearerr(diskstats_);
    return false;
  }

  counters.read_bytes = raw_.sectors_read * kSectorBytes;
  counters.write_bytes = raw_.sectors_written * kSectorBytes;
  return true;
}

const DiskSensor::RawFields& DiskSensor::raw() const noexcept { return raw_; }

}  // namespace hostpulse::sensors
