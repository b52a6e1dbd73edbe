#include "core/sampler.hpp"

#include <algorithm>
#include <cmath>
#include <string>
#include <utility>

#include "core/errors.hpp"
#include "core/math.hpp"

namespace hostpulse::core {
namespace {

double finite_percent(const char* field, const double value) {
  if (!std::isfinite(value)) {
    throw MetricUnavailable(std::string(field) + ": source returned a non-finite percentage");
  }
  return round_one_decimal(clamp_percent(value));
}

}  // namespace

Sampler::Sampler(sensors::MetricSource& source, SamplerOptions options)
    : source_(source), options_(std::move(options)) {
  options_.cpu_interval = std::max(options_.cpu_interval, kMinCpuInterval);
}

model::HealthSnapshot Sampler::sample() {
  const double cpu = source_.cpu_percent(options_.cpu_interval);
  const sensors::MemoryStats memory = source_.memory_stats();
  const sensors::FilesystemStats disk = source_.filesystem_stats(options_.disk_path);
  const sensors::DiskIoCounters io = source_.disk_io_counters();

  model::HealthSnapshot snapshot{};
  snapshot.status = model::kStatusHealthy;
  snapshot.cpu_usage = finite_percent("cpu_usage", cpu);

  snapshot.memory_total = memory.total;
  snapshot.memory_available = std::min(memory.available, memory.total);
  snapshot.memory_used = std::min(memory.used, memory.total);
  snapshot.memory_percent = finite_percent("memory_percent", memory.percent);

  snapshot.disk_total = disk.total;
  snapshot.disk_used = std::min(disk.used, disk.total);
  snapshot.disk_free = std::min(disk.free, disk.total);
  snapshot.disk_percent = finite_percent("disk_percent", disk.percent);

  snapshot.disk_read_bytes = io.read_bytes;
  snapshot.disk_write_bytes = io.write_bytes;
  return snapshot;
}

const SamplerOptions& Sampler::options() const noexcept { return options_; }

}  // namespace hostpulse::core
