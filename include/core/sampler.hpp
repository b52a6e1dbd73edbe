#pragma once

#include "core/config.hpp"
#include "model/health_snapshot.hpp"
#include "sensors/metric_source.hpp"

namespace hostpulse::core {

// Takes one HealthSnapshot from a MetricSource. Any MetricUnavailable thrown
// by the source propagates unchanged.
class Sampler {
 public:
  explicit Sampler(sensors::MetricSource& source, SamplerOptions options = {});

  [[nodiscard]] model::HealthSnapshot sample();

  [[nodiscard]] const SamplerOptions& options() const noexcept;

 private:
  sensors::MetricSource& source_;
  SamplerOptions options_;
};

}  // namespace hostpulse::core
