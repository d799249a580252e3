#pragma once
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include "model/DataPoint.hpp"

namespace vigil::model {

enum class AlertLevel { Info, Warning, Error, Critical };

[[nodiscard]] const char* to_string(AlertLevel level);
// Accepts info|warning|error|critical (case-sensitive).
[[nodiscard]] std::optional<AlertLevel> parse_alert_level(std::string_view s);

struct AlertRule {
  std::string id;
  AlertLevel level{AlertLevel::Warning};
  std::function<bool(const DataPoint&)> predicate;
  std::function<std::string(const DataPoint&)> message;
};

// One record per rule id. Re-firing after resolution reuses the record.
struct Alert {
  std::string rule_id;
  AlertLevel level{AlertLevel::Warning};
  std::string message;
  std::chrono::system_clock::time_point first_fired_at{};
  bool resolved{false};
  std::optional<std::chrono::system_clock::time_point> resolved_at;
};

enum class AlertEventKind { Raised, Resolved };

struct AlertEvent {
  AlertEventKind kind{AlertEventKind::Raised};
  Alert alert; // state after the transition
};

} // namespace vigil::model
