#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>

#include "sensors/metric_source.hpp"

namespace hostpulse::sensors {

class MemorySensor {
 public:
  struct RawFields {
    std::uint64_t mem_total_kb{0};
    std::uint64_t mem_free_kb{0};
    std::uint64_t mem_available_kb{0};
    std::uint64_t buffers_kb{0};
    std::uint64_t cached_kb{0};
    std::uint64_t sreclaimable_kb{0};
    bool has_mem_available{false};
  };

  MemorySensor();
  explicit MemorySensor(std::FILE* meminfo, bool owns_file = false);
  ~MemorySensor();

  MemorySensor(const MemorySensor&) = delete;
  MemorySensor& operator=(const MemorySensor&) = delete;

  bool sample(MemoryStats& stats) noexcept;
  const RawFields& raw() const noexcept;

 private:
  static constexpr std::size_t kReadBufferSize = 512;

  bool parse_meminfo() noexcept;

  std::FILE* meminfo_{nullptr};
  bool owns_file_{true};
  RawFields raw_{};
};

}  // namespace hostpulse::sensors
