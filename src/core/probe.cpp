#include "core/probe.hpp"

#include <ostream>
#include <sstream>
#include <utility>

#include "core/errors.hpp"

namespace hostpulse::core {

Probe::Probe(ProbeConfig config, sensors::MetricSource& source)
    : config_(std::move(config)), sampler_(source, config_.sampler), sink_(config_.output.indent) {}

int Probe::run_once(std::ostream& out, std::ostream& err) {
  try {
    const model::HealthSnapshot snapshot = sampler_.sample();
    sink_.publish(snapshot, out);
  } catch (const MetricUnavailable& ex) {
    err << "[hostpulse] metric unavailable: " << ex.what() << '\n';
    return kExitMetricUnavailable;
  } catch (const SerializationFailure& ex) {
    err << "[hostpulse] serialization failure: " << ex.what() << '\n';
    return kExitSerializationFailure;
  }
  return kExitOk;
}

std::string format_config_settings(const ProbeConfig& config, const std::string& config_path) {
  std::ostringstream output;
  output << "[hostpulse] loaded config from " << (config_path.empty() ? "<defaults>" : config_path)
         << " | cpu_interval_ms=" << config.sampler.cpu_interval.count()
         << " | disk_path=" << config.sampler.disk_path
         << " | output_indent=" << config.output.indent
         << " | verbose=" << (config.verbose ? "true" : "false");
  return output.str();
}

}  // namespace hostpulse::core
