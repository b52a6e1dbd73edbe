#pragma once

#include <iosfwd>
#include <string>

#include <nlohmann/json.hpp>

#include "model/health_snapshot.hpp"

namespace hostpulse::sinks {

// Field order follows the HealthSnapshot declaration.
nlohmann::ordered_json to_json(const model::HealthSnapshot& snapshot);

class JsonStdoutSink {
 public:
  explicit JsonStdoutSink(int indent = -1);

  // Throws core::SerializationFailure.
  [[nodiscard]] std::string render(const model::HealthSnapshot& snapshot) const;

  // Writes the rendered document and a newline in one write. Nothing reaches
  // the stream when rendering fails.
  void publish(const model::HealthSnapshot& snapshot, std::ostream& out) const;

 private:
  int indent_{-1};
};

}  // namespace hostpulse::sinks
