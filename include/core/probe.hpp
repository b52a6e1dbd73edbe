#pragma once

#include <iosfwd>
#include <string>

#include "core/config.hpp"
#include "core/sampler.hpp"
#include "sensors/metric_source.hpp"
#include "sinks/json_stdout.hpp"

namespace hostpulse::core {

enum ExitCode : int {
  kExitOk = 0,
  kExitConfigError = 1,
  kExitMetricUnavailable = 2,
  kExitSerializationFailure = 3,
};

// One sample-serialize-print cycle. `out` receives either a complete JSON
// document or nothing; diagnostics go to `err`.
class Probe {
 public:
  Probe(ProbeConfig config, sensors::MetricSource& source);

  int run_once(std::ostream& out, std::ostream& err);

 private:
  ProbeConfig config_;
  Sampler sampler_;
  sinks::JsonStdoutSink sink_;
};

std::string format_config_settings(const ProbeConfig& config, const std::string& config_path);

}  // namespace hostpulse::core
