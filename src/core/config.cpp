#include "core/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace hostpulse::core {
namespace {

std::string trim(const std::string& value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c) != 0; });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

std::string unquote(const std::string& value) {
  if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool parse_bool(const std::string& key, const std::string& value) {
  std::string lower;
  lower.reserve(value.size());
  for (const char c : value) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }

  if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
    return true;
  }
  if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
    return false;
  }
  throw std::runtime_error(key + " must be a boolean, got '" + value + "'");
}

long long parse_integer(const std::string& key, const std::string& value) {
  std::size_t consumed = 0;
  long long parsed = 0;
  try {
    parsed = std::stoll(value, &consumed);
  } catch (const std::exception&) {
    throw std::runtime_error(key + " must be an integer, got '" + value + "'");
  }
  if (consumed != value.size()) {
    throw std::runtime_error(key + " must be an integer, got '" + value + "'");
  }
  return parsed;
}

void apply_key_value(ProbeConfig& config, const std::string& key, const std::string& value) {
  if (key == "sampler.cpu_interval_ms") {
    const auto interval_ms = parse_integer(key, value);
    if (interval_ms < kMinCpuInterval.count()) {
      throw std::runtime_error("sampler.cpu_interval_ms must be at least 1000");
    }
    if (interval_ms > kMaxCpuInterval.count()) {
      throw std::runtime_error("sampler.cpu_interval_ms must be less than or equal to 60000");
    }
    config.sampler.cpu_interval = std::chrono::milliseconds(interval_ms);
    return;
  }

  if (key == "sampler.disk_path") {
    const std::string path = unquote(value);
    if (path.empty()) {
      throw std::runtime_error("sampler.disk_path must not be empty");
    }
    config.sampler.disk_path = path;
    return;
  }

  if (key == "output.indent") {
    const auto indent = parse_integer(key, value);
    if (indent < -1 || indent > 16) {
      throw std::runtime_error("output.indent must be in range -1..16");
    }
    config.output.indent = static_cast<int>(indent);
    return;
  }

  if (key == "agent.verbose") {
    config.verbose = parse_bool(key, value);
  }
}

}  // namespace

ProbeConfig load_probe_config(const std::string& path) {
  ProbeConfig config{};

  std::ifstream input(path);
  if (!input.is_open()) {
    throw std::runtime_error("unable to open config file: " + path);
  }

  std::vector<std::string> sections;
  std::string line;
  while (std::getline(input, line)) {
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.erase(comment_pos);
    }

    if (trim(line).empty()) {
      continue;
    }

    std::size_t indent_spaces = 0;
    while (indent_spaces < line.size() && line[indent_spaces] == ' ') {
      ++indent_spaces;
    }
    const std::size_t depth = indent_spaces / 2;

    const std::string stripped = trim(line);
    const auto colon_pos = stripped.find(':');
    if (colon_pos == std::string::npos) {
      continue;
    }

    const std::string key = trim(stripped.substr(0, colon_pos));
    const std::string value = trim(stripped.substr(colon_pos + 1));

    if (sections.size() != depth) {
      sections.resize(depth);
    }

    if (value.empty()) {
      sections.push_back(key);
      continue;
    }

    std::ostringstream full_key;
    for (const auto& section : sections) {
      if (!section.empty()) {
        full_key << section << '.';
      }
    }
    full_key << key;

    apply_key_value(config, full_key.str(), value);
  }

  if (input.bad()) {
    throw std::runtime_error("error reading config file: " + path);
  }

  return config;
}

}  // namespace hostpulse::core
