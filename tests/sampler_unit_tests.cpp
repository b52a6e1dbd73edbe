#include <chrono>
#include <cmath>
#include <cstdint>
#include <limits>
#include <iostream>
#include <set>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/probe.hpp"
#include "core/sampler.hpp"
#include "model/health_snapshot.hpp"
#include "sensors/filesystem.hpp"
#include "sensors/metric_source.hpp"
#include "sensors/proc_metric_source.hpp"
#include "sinks/json_stdout.hpp"

using hostpulse::core::MetricUnavailable;
using hostpulse::core::Probe;
using hostpulse::core::ProbeConfig;
using hostpulse::core::Sampler;
using hostpulse::core::SamplerOptions;
using hostpulse::model::HealthSnapshot;
using hostpulse::sensors::DiskIoCounters;
using hostpulse::sensors::FilesystemSensor;
using hostpulse::sensors::FilesystemStats;
using hostpulse::sensors::MemoryStats;
using hostpulse::sensors::MetricSource;
using hostpulse::sensors::ProcMetricSource;
using hostpulse::sinks::JsonStdoutSink;

namespace {

const char* kScenarioJson =
    "{\"status\":\"healthy\",\"cpu_usage\":15.2,\"memory_total\":17179869184,\"memory_available\":8589934592,"
    "\"memory_used\":8589934592,\"memory_percent\":50.0,\"disk_total\":1000204886016,\"disk_used\":500102443008,"
    "\"disk_free\":500102443008,\"disk_percent\":50.0,\"disk_read_bytes\":1234567890,\"disk_write_bytes\":987654321}";

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

enum class FailingQuery { none, cpu, memory, filesystem, disk_io };

class FakeMetricSource : public MetricSource {
 public:
  double cpu_percent(const std::chrono::milliseconds interval) override {
    requested_interval = interval;
    ++calls;
    fail_if(FailingQuery::cpu, "cpu: permission denied");
    return cpu;
  }

  MemoryStats memory_stats() override {
    ++calls;
    fail_if(FailingQuery::memory, "memory: permission denied");
    return memory;
  }

  FilesystemStats filesystem_stats(const std::string& path) override {
    requested_path = path;
    ++calls;
    fail_if(FailingQuery::filesystem, "filesystem: permission denied");
    return filesystem;
  }

  DiskIoCounters disk_io_counters() override {
    ++calls;
    fail_if(FailingQuery::disk_io, "disk io: permission denied");
    return io;
  }

  double cpu{15.2};
  MemoryStats memory{17179869184ULL, 8589934592ULL, 8589934592ULL, 50.0};
  FilesystemStats filesystem{1000204886016ULL, 500102443008ULL, 500102443008ULL, 50.0};
  DiskIoCounters io{1234567890ULL, 987654321ULL};
  FailingQuery failing{FailingQuery::none};

  std::chrono::milliseconds requested_interval{0};
  std::string requested_path{};
  int calls{0};

 private:
  void fail_if(const FailingQuery query, const char* message) const {
    if (failing == query) {
      throw MetricUnavailable(message);
    }
  }
};

// Real statvfs for the filesystem query, fixed values for everything else.
class RealFilesystemSource : public FakeMetricSource {
 public:
  FilesystemStats filesystem_stats(const std::string& path) override {
    requested_path = path;
    FilesystemStats stats{};
    if (!sensor_.sample(path, stats)) {
      throw MetricUnavailable("filesystem: statvfs(" + path + ") failed");
    }
    return stats;
  }

 private:
  FilesystemSensor sensor_{};
};

int test_scenario_output_matches_exactly() {
  FakeMetricSource source{};
  Sampler sampler{source};
  const HealthSnapshot snapshot = sampler.sample();

  const std::string rendered = JsonStdoutSink{}.render(snapshot);
  if (rendered != std::string(kScenarioJson) + "\n") {
    std::cerr << rendered;
    return fail("test_scenario_output_matches_exactly", "rendered document mismatch");
  }

  if (nlohmann::json::parse(rendered) != nlohmann::json::parse(kScenarioJson)) {
    return fail("test_scenario_output_matches_exactly", "parsed document mismatch");
  }

  if (source.requested_interval != std::chrono::milliseconds(1000) || source.requested_path != "/") {
    return fail("test_scenario_output_matches_exactly", "default interval/path not requested");
  }
  return 0;
}

int test_document_shape_and_types() {
  FakeMetricSource source{};
  source.cpu = 3.0;
  source.memory.percent = 12.0;
  Sampler sampler{source};

  const auto document = nlohmann::json::parse(JsonStdoutSink{}.render(sampler.sample()));
  if (!document.is_object() || document.size() != 12) {
    return fail("test_document_shape_and_types", "document must be an object with twelve keys");
  }

  const std::set<std::string> byte_fields{"memory_total", "memory_available", "memory_used", "disk_total",
                                          "disk_used",    "disk_free",        "disk_read_bytes", "disk_write_bytes"};
  const std::set<std::string> percent_fields{"cpu_usage", "memory_percent", "disk_percent"};

  for (const auto& item : document.items()) {
    if (item.key() == "status") {
      if (!item.value().is_string() || item.value() != "healthy") {
        return fail("test_document_shape_and_types", "status must be the string healthy");
      }
    } else if (byte_fields.count(item.key()) != 0) {
      if (!item.value().is_number_unsigned()) {
        return fail("test_document_shape_and_types", "byte counts must be JSON integers");
      }
    } else if (percent_fields.count(item.key()) != 0) {
      if (!item.value().is_number_float()) {
        return fail("test_document_shape_and_types", "percentages must be JSON floating-point numbers");
      }
    } else {
      return fail("test_document_shape_and_types", "unexpected key in document");
    }
  }

  // Whole-number percentages keep their decimal point.
  const std::string compact = JsonStdoutSink{}.render(sampler.sample());
  if (compact.find("\"cpu_usage\":3.0") == std::string::npos) {
    return fail("test_document_shape_and_types", "integral percentage rendered without fraction");
  }
  return 0;
}

int test_sampler_clamps_and_rounds() {
  FakeMetricSource source{};
  source.cpu = 130.0;
  source.memory = {1000, 5000, 4000, 101.0};
  source.filesystem = {100, 250, 300, 33.3333};
  Sampler sampler{source};

  const HealthSnapshot snapshot = sampler.sample();
  if (snapshot.cpu_usage != 100.0 || snapshot.memory_percent != 100.0) {
    return fail("test_sampler_clamps_and_rounds", "percentages must be clamped to 100");
  }
  if (snapshot.memory_available > snapshot.memory_total || snapshot.memory_used > snapshot.memory_total) {
    return fail("test_sampler_clamps_and_rounds", "memory fields must not exceed total");
  }
  if (snapshot.disk_used > snapshot.disk_total || snapshot.disk_free > snapshot.disk_total) {
    return fail("test_sampler_clamps_and_rounds", "disk fields must not exceed total");
  }
  if (std::fabs(snapshot.disk_percent - 33.3) > 1e-9) {
    return fail("test_sampler_clamps_and_rounds", "percentages must be rounded to one decimal");
  }

  source.cpu = -4.0;
  if (sampler.sample().cpu_usage != 0.0) {
    return fail("test_sampler_clamps_and_rounds", "negative cpu must clamp to 0");
  }
  return 0;
}

int test_sampler_enforces_minimum_cpu_window() {
  FakeMetricSource source{};
  SamplerOptions options{};
  options.cpu_interval = std::chrono::milliseconds(10);
  options.disk_path = "/srv";
  Sampler sampler{source, options};
  if (sampler.options().cpu_interval != std::chrono::milliseconds(1000)) {
    return fail("test_sampler_enforces_minimum_cpu_window", "options must report the raised window");
  }

  (void)sampler.sample();
  if (source.requested_interval != std::chrono::milliseconds(1000)) {
    return fail("test_sampler_enforces_minimum_cpu_window", "cpu window below one second must be raised");
  }
  if (source.requested_path != "/srv") {
    return fail("test_sampler_enforces_minimum_cpu_window", "configured disk path not used");
  }

  options.cpu_interval = std::chrono::milliseconds(2500);
  Sampler slower{source, options};
  (void)slower.sample();
  if (source.requested_interval != std::chrono::milliseconds(2500)) {
    return fail("test_sampler_enforces_minimum_cpu_window", "longer window must be kept");
  }
  return 0;
}

int test_probe_success_writes_single_line() {
  FakeMetricSource source{};
  Probe probe{ProbeConfig{}, source};

  std::ostringstream out;
  std::ostringstream err;
  if (probe.run_once(out, err) != hostpulse::core::kExitOk) {
    return fail("test_probe_success_writes_single_line", "expected exit code 0");
  }
  if (out.str() != std::string(kScenarioJson) + "\n") {
    return fail("test_probe_success_writes_single_line", "stdout must hold exactly one JSON line");
  }
  if (!err.str().empty()) {
    return fail("test_probe_success_writes_single_line", "stderr must be empty on success");
  }
  return 0;
}

int test_probe_permission_denied_emits_nothing() {
  const FailingQuery queries[] = {FailingQuery::cpu, FailingQuery::memory, FailingQuery::filesystem,
                                  FailingQuery::disk_io};
  for (const FailingQuery query : queries) {
    FakeMetricSource source{};
    source.failing = query;
    Probe probe{ProbeConfig{}, source};

    std::ostringstream out;
    std::ostringstream err;
    const int rc = probe.run_once(out, err);
    if (rc != hostpulse::core::kExitMetricUnavailable) {
      return fail("test_probe_permission_denied_emits_nothing", "failed query must exit non-zero");
    }
    if (!out.str().empty()) {
      return fail("test_probe_permission_denied_emits_nothing", "stdout must stay empty on failure");
    }
    if (err.str().find("permission denied") == std::string::npos) {
      return fail("test_probe_permission_denied_emits_nothing", "diagnostic must reach stderr");
    }
  }
  return 0;
}

int test_probe_missing_root_path_is_fatal() {
  RealFilesystemSource source{};
  ProbeConfig config{};
  config.sampler.disk_path = "/nonexistent/hostpulse/root";
  Probe probe{config, source};

  std::ostringstream out;
  std::ostringstream err;
  if (probe.run_once(out, err) != hostpulse::core::kExitMetricUnavailable) {
    return fail("test_probe_missing_root_path_is_fatal", "unresolvable path must be MetricUnavailable");
  }
  if (!out.str().empty()) {
    return fail("test_probe_missing_root_path_is_fatal", "stdout must stay empty");
  }

  RealFilesystemSource root_source{};
  Probe root_probe{ProbeConfig{}, root_source};
  std::ostringstream root_out;
  if (root_probe.run_once(root_out, err) != hostpulse::core::kExitOk) {
    return fail("test_probe_missing_root_path_is_fatal", "real root filesystem should sample");
  }

  const auto document = nlohmann::json::parse(root_out.str());
  const auto total = document.at("disk_total").get<std::uint64_t>();
  const auto used = document.at("disk_used").get<std::uint64_t>();
  const auto free = document.at("disk_free").get<std::uint64_t>();
  const auto percent = document.at("disk_percent").get<double>();
  if (total == 0 || used > total || free > total || percent < 0.0 || percent > 100.0) {
    return fail("test_probe_missing_root_path_is_fatal", "root filesystem invariants violated");
  }
  return 0;
}

int test_probe_write_failure_is_reported() {
  FakeMetricSource source{};
  Probe probe{ProbeConfig{}, source};

  std::ostringstream out;
  out.setstate(std::ios::badbit);
  std::ostringstream err;
  if (probe.run_once(out, err) != hostpulse::core::kExitSerializationFailure) {
    return fail("test_probe_write_failure_is_reported", "broken output stream must exit with serialization failure");
  }
  if (err.str().find("serialization failure") == std::string::npos) {
    return fail("test_probe_write_failure_is_reported", "diagnostic missing");
  }
  return 0;
}

int test_pretty_output_indent() {
  FakeMetricSource source{};
  ProbeConfig config{};
  config.output.indent = 4;
  Probe probe{config, source};

  std::ostringstream out;
  std::ostringstream err;
  if (probe.run_once(out, err) != 0) {
    return fail("test_pretty_output_indent", "expected success");
  }
  const std::string text = out.str();
  if (text.rfind("{\n    \"status\": \"healthy\",\n", 0) != 0 || text.back() != '\n') {
    return fail("test_pretty_output_indent", "indented rendering mismatch");
  }
  if (nlohmann::json::parse(text) != nlohmann::json::parse(kScenarioJson)) {
    return fail("test_pretty_output_indent", "indented document content mismatch");
  }
  return 0;
}

int test_non_finite_percentages_are_rejected() {
  const double bad_values[] = {std::numeric_limits<double>::quiet_NaN(), std::numeric_limits<double>::infinity(),
                               -std::numeric_limits<double>::infinity()};
  for (const double bad : bad_values) {
    for (int field = 0; field < 3; ++field) {
      FakeMetricSource source{};
      if (field == 0) {
        source.cpu = bad;
      } else if (field == 1) {
        source.memory.percent = bad;
      } else {
        source.filesystem.percent = bad;
      }

      Probe probe{ProbeConfig{}, source};
      std::ostringstream out;
      std::ostringstream err;
      if (probe.run_once(out, err) != hostpulse::core::kExitMetricUnavailable) {
        return fail("test_non_finite_percentages_are_rejected", "non-finite percentage must be MetricUnavailable");
      }
      if (!out.str().empty()) {
        return fail("test_non_finite_percentages_are_rejected", "stdout must stay empty");
      }
      if (err.str().find("non-finite") == std::string::npos) {
        return fail("test_non_finite_percentages_are_rejected", "diagnostic must name the problem");
      }
    }
  }
  return 0;
}

bool percent_in_range(const double value) { return value >= 0.0 && value <= 100.0; }

int test_real_proc_source_invariants_across_two_samples() {
  ProcMetricSource source{};
  Sampler sampler{source};

  HealthSnapshot first{};
  HealthSnapshot second{};
  try {
    first = sampler.sample();
    second = sampler.sample();
  } catch (const MetricUnavailable& ex) {
    std::cerr << ex.what() << '\n';
    return fail("test_real_proc_source_invariants_across_two_samples", "host metrics must be readable");
  }

  if (second.disk_read_bytes < first.disk_read_bytes || second.disk_write_bytes < first.disk_write_bytes) {
    return fail("test_real_proc_source_invariants_across_two_samples", "disk io counters must not decrease");
  }

  for (const HealthSnapshot* snapshot : {&first, &second}) {
    if (snapshot->status != "healthy") {
      return fail("test_real_proc_source_invariants_across_two_samples", "status must be healthy");
    }
    if (snapshot->memory_total == 0 || snapshot->memory_available > snapshot->memory_total ||
        snapshot->memory_used > snapshot->memory_total) {
      return fail("test_real_proc_source_invariants_across_two_samples", "memory invariants violated");
    }
    if (snapshot->disk_total == 0 || snapshot->disk_used > snapshot->disk_total ||
        snapshot->disk_free > snapshot->disk_total) {
      return fail("test_real_proc_source_invariants_across_two_samples", "disk capacity invariants violated");
    }
    if (!percent_in_range(snapshot->cpu_usage) || !percent_in_range(snapshot->memory_percent) ||
        !percent_in_range(snapshot->disk_percent)) {
      return fail("test_real_proc_source_invariants_across_two_samples", "percentages must be within [0, 100]");
    }
  }
  return 0;
}

}  // namespace

int main() {
  if (int rc = test_scenario_output_matches_exactly(); rc != 0) return rc;
  if (int rc = test_document_shape_and_types(); rc != 0) return rc;
  if (int rc = test_sampler_clamps_and_rounds(); rc != 0) return rc;
  if (int rc = test_sampler_enforces_minimum_cpu_window(); rc != 0) return rc;
  if (int rc = test_probe_success_writes_single_line(); rc != 0) return rc;
  if (int rc = test_probe_permission_denied_emits_nothing(); rc != 0) return rc;
  if (int rc = test_probe_missing_root_path_is_fatal(); rc != 0) return rc;
  if (int rc = test_probe_write_failure_is_reported(); rc != 0) return rc;
  if (int rc = test_pretty_output_indent(); rc != 0) return rc;
  if (int rc = test_non_finite_percentages_are_rejected(); rc != 0) return rc;
  if (int rc = test_real_proc_source_invariants_across_two_samples(); rc != 0) return rc;

  std::cout << "[PASS] sampler unit tests\n";
  return 0;
}
