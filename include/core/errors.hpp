#pragma once

#include <stdexcept>
#include <string>

namespace hostpulse::core {

// The OS refused or could not service a metric query.
class MetricUnavailable : public std::runtime_error {
 public:
  explicit MetricUnavailable(const std::string& what) : std::runtime_error(what) {}
};

class SerializationFailure : public std::runtime_error {
 public:
  explicit SerializationFailure(const std::string& what) : std::runtime_error(what) {}
};

}  // namespace hostpulse::core
