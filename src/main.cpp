#include <exception>
#include <iostream>
#include <string>

#include "core/config.hpp"
#include "core/probe.hpp"
#include "sensors/proc_metric_source.hpp"

int main(int argc, char** argv) {
  const std::string config_path = argc > 1 ? argv[1] : "";

  hostpulse::core::ProbeConfig config{};
  if (!config_path.empty()) {
    try {
      config = hostpulse::core::load_probe_config(config_path);
    } catch (const std::exception& ex) {
      std::cerr << "[config] error: " << ex.what() << '\n';
      return hostpulse::core::kExitConfigError;
    }
  }

  if (config.verbose) {
    std::cerr << hostpulse::core::format_config_settings(config, config_path) << '\n';
  }

  hostpulse::sensors::ProcMetricSource source{};
  hostpulse::core::Probe probe{config, source};
  return probe.run_once(std::cout, std::cerr);
}
