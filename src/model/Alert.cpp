#include "model/Alert.hpp"

namespace vigil::model {

const char* to_string(AlertLevel level) {
  switch (level) {
    case AlertLevel::Info:     return "info";
    case AlertLevel::Warning:  return "warning";
    case AlertLevel::Error:    return "error";
    case AlertLevel::Critical: return "critical";
  }
  return "unknown";
}

std::optional<AlertLevel> parse_alert_level(std::string_view s) {
  if (s == "info") return AlertLevel::Info;
  if (s == "warning") return AlertLevel::Warning;
  if (s == "error") return AlertLevel::Error;
  if (s == "critical") return AlertLevel::Critical;
  return std::nullopt;
}

} // namespace vigil::model
