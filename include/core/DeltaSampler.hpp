#pragma once
#include <chrono>
#include <stop_token>
#include "collectors/ICounterSource.hpp"
#include "model/DataPoint.hpp"

namespace vigil::core {

struct CpuShare {
  double usage_pct{};  // user + sys
  double user_pct{};
  double sys_pct{};
};

// Utilization over the window between two cumulative snapshots. A window with
// no positive total reports 0%; every share is clamped to [0,100].
[[nodiscard]] CpuShare cpu_share(const vigil::model::CpuTicks& s0, const vigil::model::CpuTicks& s1);

// used/total as a percentage; total == 0 yields 0, result clamped to [0,100].
[[nodiscard]] double usage_pct(uint64_t used, uint64_t total);

// Double-sampling collector: read, wait, read again, turn the deltas into a DataPoint.
class DeltaSampler {
public:
  explicit DeltaSampler(vigil::collectors::ICounterSource& source) : source_(source) {}

  // Throws SamplingError if interval <= 0 or the wait is interrupted through
  // `st`, SourceUnavailable if either snapshot cannot be read.
  [[nodiscard]] vigil::model::DataPoint sample(std::chrono::milliseconds interval,
                                               std::stop_token st = {});

private:
  vigil::collectors::ICounterSource& source_;
};

} // namespace vigil::core
