#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace vigil::model {

// One collected sample. Produced by DeltaSampler and never modified afterwards.
struct DataPoint {
  std::chrono::system_clock::time_point timestamp{};
  double cpu_usage_pct{};   // (user+sys) share of the delta window, 0..100
  double cpu_user_pct{};
  double cpu_sys_pct{};
  int    cpu_count{0};
  double memory_usage_pct{};
  uint64_t memory_total_bytes{};
  uint64_t memory_used_bytes{};
  std::map<std::string, double> disk_usage_pct; // mount id -> 0..100
};

} // namespace vigil::model
