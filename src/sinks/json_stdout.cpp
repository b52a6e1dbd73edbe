#include "sinks/json_stdout.hpp"

#include <ostream>

#include "core/errors.hpp"

namespace hostpulse::sinks {

nlohmann::ordered_json to_json(const model::HealthSnapshot& snapshot) {
  nlohmann::ordered_json document = nlohmann::ordered_json::object();
  document["status"] = snapshot.status;
  document["cpu_usage"] = snapshot.cpu_usage;
  document["memory_total"] = snapshot.memory_total;
  document["memory_available"] = snapshot.memory_available;
  document["memory_used"] = snapshot.memory_used;
  document["memory_percent"] = snapshot.memory_percent;
  document["disk_total"] = snapshot.disk_total;
  document["disk_used"] = snapshot.disk_used;
  document["disk_free"] = snapshot.disk_free;
  document["disk_percent"] = snapshot.disk_percent;
  document["disk_read_bytes"] = snapshot.disk_read_bytes;
  document["disk_write_bytes"] = snapshot.disk_write_bytes;
  return document;
}

JsonStdoutSink::JsonStdoutSink(const int indent) : indent_(indent) {}

std::string JsonStdoutSink::render(const model::HealthSnapshot& snapshot) const {
  try {
    std::string text = to_json(snapshot).dump(indent_);
    text.push_back('\n');
    return text;
  } catch (const nlohmann::json::exception& ex) {
    throw core::SerializationFailure(std::string("json: ") + ex.what());
  }
}

void JsonStdoutSink::publish(const model::HealthSnapshot& snapshot, std::ostream& out) const {
  const std::string text = render(snapshot);
  out.write(text.data(), static_cast<std::streamsize>(text.size()));
  out.flush();
  if (!out) {
    throw core::SerializationFailure("unable to write snapshot to output stream");
  }
}

}  // namespace hostpulse::sinks
