#pragma once
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "core/TrendAnalyzer.hpp"
#include "model/Alert.hpp"

namespace vigil::app {

struct MonitorConfig {
  int interval_ms{5000};       // tick period
  int sample_window_ms{1000};  // DeltaSampler wait between the two CPU reads
  int history_size{120};
  bool alerts_enabled{true};
  // "<metric>" or "<metric>.<level>" -> percent; metric is cpu|memory|disk
  std::map<std::string, double> thresholds{{"cpu", 80.0}, {"memory", 85.0}, {"disk", 90.0}};
  vigil::core::TrendOptions trend{};
};

// Partial update; absent fields keep their current value.
struct ConfigPatch {
  std::optional<int> interval_ms;
  std::optional<int> sample_window_ms;
  std::optional<int> history_size;
  std::optional<bool> alerts_enabled;
  std::map<std::string, double> thresholds;      // merged key by key
  std::vector<std::string> remove_thresholds;
  std::optional<double> trend_relative_threshold;
  std::optional<double> trend_zero_mean_threshold;
  std::optional<int> trend_forecast_periods;
};

constexpr int kMaxHistorySize = 100000;

struct ThresholdKey {
  std::string metric;
  vigil::model::AlertLevel level{vigil::model::AlertLevel::Warning};
};

[[nodiscard]] std::optional<ThresholdKey> parse_threshold_key(std::string_view key);

// Throws InvalidConfig naming the first offending field.
void validate(const MonitorConfig& cfg);

// Returns base with patch applied; the result is validated, base is untouched.
[[nodiscard]] MonitorConfig apply_patch(const MonitorConfig& base, const ConfigPatch& patch);

} // namespace vigil::app
