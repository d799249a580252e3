#pragma once
#include <map>
#include <string>
#include <vector>
#include "model/DataPoint.hpp"

namespace vigil::core {

enum class TrendDirection { Up, Down, Stable };

[[nodiscard]] const char* to_string(TrendDirection d);

struct TrendOptions {
  // |second half mean - first half mean| below this share of the first half mean is stable
  double relative_threshold{0.05};
  // Absolute band used instead when the first half mean is 0
  double zero_mean_threshold{1.0};
  int forecast_periods{5};
};

// Compare the means of the first and second half of an oldest-first window.
// For an odd length the middle element belongs to neither half.
// Fewer than two values is Stable.
[[nodiscard]] TrendDirection trend(const std::vector<double>& values, const TrendOptions& opts = {});

// Ordinary least squares over indices 0..n-1, extrapolated `periods` steps past
// n-1 and clamped to [0,100]. Fewer than 3 values (or periods <= 0) gives an
// empty result.
[[nodiscard]] std::vector<double> forecast(const std::vector<double>& values, int periods);

struct SeriesTrend {
  TrendDirection direction{TrendDirection::Stable};
  std::vector<double> forecast;
  double latest{};
  double mean{};
  double min{};
  double max{};
  size_t samples{};
};

struct TrendReport {
  size_t samples{};
  SeriesTrend cpu;
  SeriesTrend memory;
  std::map<std::string, SeriesTrend> disks; // mounts present in the newest point
};

[[nodiscard]] SeriesTrend analyze_series(const std::vector<double>& values, const TrendOptions& opts);

// Points must be oldest first, as returned by HistoryBuffer.
[[nodiscard]] TrendReport analyze(const std::vector<vigil::model::DataPoint>& points, const TrendOptions& opts);

} // namespace vigil::core
