#pragma once

#include <cstddef>
#include <cstdint>
#include <cstdio>

namespace hostpulse::sensors {

class CpuSensor {
 public:
  CpuSensor();
  explicit CpuSensor(std::FILE* file, bool owns_file = false);
  ~CpuSensor();

  CpuSensor(const CpuSensor&) = delete;
  CpuSensor& operator=(const CpuSensor&) = delete;

  // First call records the baseline and reports 0. Later calls report the
  // busy percentage since the previous call.
  bool sample(double& busy_percent) noexcept;

  [[nodiscard]] bool has_baseline() const noexcept;

 private:
  static constexpr std::size_t kReadBufferSize = 512;

  std::FILE* file_{nullptr};
  bool owns_file_{true};
  std::uint64_t prev_total_{0};
  std::uint64_t prev_idle_{0};
  bool has_prev_{false};
};

}  // namespace hostpulse::sensors
