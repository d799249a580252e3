#include "app/MonitorConfig.hpp"
#include "util/Errors.hpp"

#include <cmath>
#include <string>

namespace vigil::app {

std::optional<ThresholdKey> parse_threshold_key(std::string_view key) {
  std::string_view metric = key;
  std::string_view level;
  if (auto dot = key.find('.'); dot != std::string_view::npos) {
    metric = key.substr(0, dot);
    level = key.substr(dot + 1);
  }
  if (metric != "cpu" && metric != "memory" && metric != "disk") return std::nullopt;
  ThresholdKey out{std::string(metric), vigil::model::AlertLevel::Warning};
  if (!level.empty()) {
    auto lv = vigil::model::parse_alert_level(level);
    if (!lv) return std::nullopt;
    out.level = *lv;
  } else if (key.size() != metric.size()) {
    return std::nullopt; // trailing '.'
  }
  return out;
}

static void require(bool ok, const std::string& what) {
  if (!ok) throw vigil::InvalidConfig(what);
}

void validate(const MonitorConfig& cfg) {
  require(cfg.interval_ms > 0, "interval_ms must be > 0, got " + std::to_string(cfg.interval_ms));
  require(cfg.sample_window_ms > 0, "sample_window_ms must be > 0, got " + std::to_string(cfg.sample_window_ms));
  require(cfg.history_size > 0 && cfg.history_size <= kMaxHistorySize,
          "history_size must be in 1.." + std::to_string(kMaxHistorySize) + ", got " + std::to_string(cfg.history_size));
  for (const auto& [key, pct] : cfg.thresholds) {
    require(parse_threshold_key(key).has_value(), "unknown threshold '" + key + "'");
    require(std::isfinite(pct) && pct >= 0.0 && pct <= 100.0,
            "threshold '" + key + "' must be a percentage in [0,100]");
  }
  const auto& t = cfg.trend;
  require(std::isfinite(t.relative_threshold) && t.relative_threshold >= 0.0,
          "trend.relative_threshold must be a finite value >= 0");
  require(std::isfinite(t.zero_mean_threshold) && t.zero_mean_threshold >= 0.0,
          "trend.zero_mean_threshold must be a finite value >= 0");
  require(t.forecast_periods >= 0, "trend.forecast_periods must be >= 0");
}

MonitorConfig apply_patch(const MonitorConfig& base, const ConfigPatch& patch) {
  MonitorConfig out = base;
  if (patch.interval_ms) out.interval_ms = *patch.interval_ms;
  if (patch.sample_window_ms) out.sample_window_ms = *patch.sample_window_ms;
  if (patch.history_size) out.history_size = *patch.history_size;
  if (patch.alerts_enabled) out.alerts_enabled = *patch.alerts_enabled;
  for (const auto& key : patch.remove_thresholds) out.thresholds.erase(key);
  for (const auto& [key, pct] : patch.thresholds) out.thresholds[key] = pct;
  if (patch.trend_relative_threshold) out.trend.relative_threshold = *patch.trend_relative_threshold;
  if (patch.trend_zero_mean_threshold) out.trend.zero_mean_threshold = *patch.trend_zero_mean_threshold;
  if (patch.trend_forecast_periods) out.trend.forecast_periods = *patch.trend_forecast_periods;
  validate(out);
  return out;
}

} // namespace vigil::app
