#pragma once
#include <string>
#include "app/Monitor.hpp"
#include "core/TrendAnalyzer.hpp"

namespace vigil::app {

// Render a status (and optionally a trend report) in the Prometheus text
// exposition format, version 0.0.4.
[[nodiscard]] std::string status_to_prometheus(const MonitorStatus& s,
                                               const vigil::core::TrendReport* trend = nullptr);

} // namespace vigil::app
