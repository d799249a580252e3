#include "core/TrendAnalyzer.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace vigil::core {

const char* to_string(TrendDirection d) {
  switch (d) {
    case TrendDirection::Up:     return "up";
    case TrendDirection::Down:   return "down";
    case TrendDirection::Stable: return "stable";
  }
  return "stable";
}

static double mean_of(std::vector<double>::const_iterator b, std::vector<double>::const_iterator e) {
  auto n = std::distance(b, e);
  if (n <= 0) return 0.0;
  return std::accumulate(b, e, 0.0) / static_cast<double>(n);
}

TrendDirection trend(const std::vector<double>& values, const TrendOptions& opts) {
  const size_t half = values.size() / 2;
  if (half == 0) return TrendDirection::Stable;
  double first = mean_of(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(half));
  double second = mean_of(values.end() - static_cast<std::ptrdiff_t>(half), values.end());
  double diff = second - first;
  // A zero baseline has no meaningful relative band; fall back to an absolute one
  double band = (first == 0.0) ? opts.zero_mean_threshold : opts.relative_threshold * std::fabs(first);
  if (std::fabs(diff) < band) return TrendDirection::Stable;
  return diff > 0.0 ? TrendDirection::Up : TrendDirection::Down;
}

std::vector<double> forecast(const std::vector<double>& values, int periods) {
  std::vector<double> out;
  const size_t n = values.size();
  if (n < 3 || periods <= 0) return out;
  const double x_mean = static_cast<double>(n - 1) / 2.0;
  const double y_mean = mean_of(values.begin(), values.end());
  double sxy = 0.0, sxx = 0.0;
  for (size_t i = 0; i < n; ++i) {
    double dx = static_cast<double>(i) - x_mean;
    sxy += dx * (values[i] - y_mean);
    sxx += dx * dx;
  }
  const double slope = sxy / sxx; // sxx > 0 for n >= 2
  const double intercept = y_mean - slope * x_mean;
  out.reserve(static_cast<size_t>(periods));
  for (int k = 1; k <= periods; ++k) {
    double x = static_cast<double>(n - 1) + static_cast<double>(k);
    double y = intercept + slope * x;
    out.push_back(std::isfinite(y) ? std::clamp(y, 0.0, 100.0) : 0.0);
  }
  return out;
}

SeriesTrend analyze_series(const std::vector<double>& values, const TrendOptions& opts) {
  SeriesTrend s;
  s.samples = values.size();
  s.direction = trend(values, opts);
  s.forecast = forecast(values, opts.forecast_periods);
  if (!values.empty()) {
    s.latest = values.back();
    s.mean = mean_of(values.begin(), values.end());
    auto [mn, mx] = std::minmax_element(values.begin(), values.end());
    s.min = *mn;
    s.max = *mx;
  }
  return s;
}

TrendReport analyze(const std::vector<vigil::model::DataPoint>& points, const TrendOptions& opts) {
  TrendReport r;
  r.samples = points.size();
  std::vector<double> cpu, mem;
  cpu.reserve(points.size());
  mem.reserve(points.size());
  for (const auto& p : points) {
    cpu.push_back(p.cpu_usage_pct);
    mem.push_back(p.memory_usage_pct);
  }
  r.cpu = analyze_series(cpu, opts);
  r.memory = analyze_series(mem, opts);
  if (!points.empty()) {
    // Mounts can come and go; each series uses only the points that carry it
    for (const auto& kv : points.back().disk_usage_pct) {
      const std::string& mount = kv.first;
      std::vector<double> series;
      for (const auto& p : points) {
        auto it = p.disk_usage_pct.find(mount);
        if (it != p.disk_usage_pct.end()) series.push_back(it->second);
      }
      r.disks.emplace(mount, analyze_series(series, opts));
    }
  }
  return r;
}

} // namespace vigil::core
