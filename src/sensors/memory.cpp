#include "sensors/memory.hpp"

#include <cstring>

#include "core/math.hpp"

namespace hostpulse::sensors {

namespace {

constexpr std::uint64_t kBytesPerKb = 1024;

}  // namespace

MemorySensor::MemorySensor() : meminfo_(std::fopen("/proc/meminfo", "r")) {}

MemorySensor::MemorySensor(std::FILE* meminfo, const bool owns_file) : meminfo_(meminfo), owns_file_(owns_file) {}

MemorySensor::~MemorySensor() {
  if (owns_file_ && meminfo_ != nullptr) {
    std::fclose(meminfo_);
    meminfo_ = nullptr;
  }
}

bool MemorySensor::sample(MemoryStats& stats) noexcept {
  stats = {};
  if (!parse_meminfo()) {
    return false;
  }

  const std::uint64_t total = raw_.mem_total_kb;
  const std::uint64_t cached = raw_.cached_kb + raw_.sreclaimable_kb;

  std::uint64_t available = raw_.mem_available_kb;
  if (!raw_.has_mem_available) {
    // Pre-3.14 kernels do not export MemAvailable.
    available = raw_.mem_free_kb + raw_.buffers_kb + cached;
  }
  if (available > total) {
    available = total;
  }

  const std::uint64_t reclaimable = raw_.mem_free_kb + raw_.buffers_kb + cached;
  std::uint64_t used = 0;
  if (total >= reclaimable) {
    used = total - reclaimable;
  } else if (total >= raw_.mem_free_kb) {
    // Container kernels can report more cache than total.
    used = total - raw_.mem_free_kb;
  }

  stats.total = total * kBytesPerKb;
  stats.available = available * kBytesPerKb;
  stats.used = used * kBytesPerKb;
  stats.percent = core::ratio_percent(total - available, total);
  return true;
}

const MemorySensor::RawFields& MemorySensor::raw() const noexcept { return raw_; }

bool MemorySensor::parse_meminfo() noexcept {
  if (meminfo_ == nullptr) {
    return false;
  }

  if (std::fseek(meminfo_, 0L, SEEK_SET) != 0) {
    return false;
  }

  raw_ = {};

  char buffer[kReadBufferSize]{};
  while (std::fgets(buffer, static_cast<int>(sizeof(buffer)), meminfo_) != nullptr) {
    char key[64]{};
    unsigned long long value = 0;
    if (std::sscanf(buffer, "%63[^:]: %llu", key, &value) != 2) {
      continue;
    }

    if (std::strcmp(key, "MemTotal") == 0) {
      raw_.mem_total_kb = value;
    } else if (std::strcmp(key, "MemFree") == 0) {
      raw_.mem_free_kb = value;
    } else if (std::strcmp(key, "MemAvailable") == 0) {
      raw_.mem_available_kb = value;
      raw_.has_mem_available = true;
    } else if (std::strcmp(key, "Buffers") == 0) {
      raw_.buffers_kb = value;
    } else if (std::strcmp(key, "Cached") == 0) {
      raw_.cached_kb = value;
    } else if (std::strcmp(key, "SReclaimable") == 0) {
      raw_.sreclaimable_kb = value;
    }
  }

  if (std::ferror(meminfo_) != 0) {
    std::clearerr(meminfo_);
    return false;
  }

  return raw_.mem_total_kb != 0;
}

}  // namespace hostpulse::sensors
