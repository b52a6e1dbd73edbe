#pragma once

#include <chrono>
#include <string>

namespace hostpulse::core {

struct SamplerOptions {
  std::chrono::milliseconds cpu_interval{1000};
  std::string disk_path{"/"};
};

struct OutputOptions {
  // -1 renders the whole document on one line.
  int indent{-1};
};

struct ProbeConfig {
  SamplerOptions sampler{};
  OutputOptions output{};
  bool verbose{false};
};

inline constexpr std::chrono::milliseconds kMinCpuInterval{1000};
inline constexpr std::chrono::milliseconds kMaxCpuInterval{60000};

ProbeConfig load_probe_config(const std::string& path);

}  // namespace hostpulse::core
