#include "core/DeltaSampler.hpp"
#include "util/Errors.hpp"

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <mutex>
#include <string>

namespace vigil::core {

static double clamp_pct(double v) {
  if (!std::isfinite(v)) return 0.0;
  return std::clamp(v, 0.0, 100.0);
}

CpuShare cpu_share(const vigil::model::CpuTicks& s0, const vigil::model::CpuTicks& s1) {
  // Signed deltas: a counter that went backwards must not wrap to a huge value
  double du = static_cast<double>(s1.user) - static_cast<double>(s0.user);
  double ds = static_cast<double>(s1.sys)  - static_cast<double>(s0.sys);
  double di = static_cast<double>(s1.idle) - static_cast<double>(s0.idle);
  double total = du + ds + di;
  CpuShare out;
  if (!(total > 0.0)) return out;
  out.usage_pct = clamp_pct(100.0 * (du + ds) / total);
  out.user_pct  = clamp_pct(100.0 * du / total);
  out.sys_pct   = clamp_pct(100.0 * ds / total);
  return out;
}

double usage_pct(uint64_t used, uint64_t total) {
  if (total == 0) return 0.0;
  return clamp_pct(100.0 * static_cast<double>(used) / static_cast<double>(total));
}

vigil::model::DataPoint DeltaSampler::sample(std::chrono::milliseconds interval, std::stop_token st) {
  if (interval.count() <= 0) {
    throw vigil::SamplingError("sample interval must be positive, got " + std::to_string(interval.count()) + "ms");
  }
  auto s0 = source_.cpu_ticks();
  {
    std::mutex mu;
    std::condition_variable_any cv;
    std::unique_lock lk(mu);
    // Nothing notifies cv; it only wakes on timeout or stop request
    (void)cv.wait_for(lk, st, interval, []{ return false; });
    if (st.stop_requested()) throw vigil::SamplingError("sampling interrupted");
  }
  auto s1 = source_.cpu_ticks();

  vigil::model::DataPoint p;
  auto cpu = cpu_share(s0, s1);
  p.cpu_usage_pct = cpu.usage_pct;
  p.cpu_user_pct = cpu.user_pct;
  p.cpu_sys_pct = cpu.sys_pct;
  p.cpu_count = s1.cpu_count;

  auto mem = source_.memory();
  p.memory_total_bytes = mem.total_bytes;
  p.memory_used_bytes = mem.used_bytes;
  p.memory_usage_pct = usage_pct(mem.used_bytes, mem.total_bytes);

  for (const auto& d : source_.disks()) {
    p.disk_usage_pct[d.mount_id] = usage_pct(d.used_bytes, d.total_bytes);
  }
  p.timestamp = std::chrono::system_clock::now();
  return p;
}

} // namespace vigil::core
