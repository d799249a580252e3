#pragma once
#include <vector>
#include "app/MonitorConfig.hpp"
#include "model/Alert.hpp"

namespace vigil::app {

// One rule per configured threshold, ordered cpu, memory, disk and within a
// metric by level (info first). Rule id is "<metric>.<level>"; it fires while
// the value is >= the threshold. Disk rules watch the fullest mount.
[[nodiscard]] std::vector<vigil::model::AlertRule> make_threshold_rules(const MonitorConfig& cfg);

} // namespace vigil::app
