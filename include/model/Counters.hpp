#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace vigil::model {

// Cumulative CPU ticks aggregated across all cores.
struct CpuTicks {
  uint64_t user{};   // user + nice
  uint64_t sys{};    // system + irq + softirq + steal
  uint64_t idle{};   // idle + iowait
  int      cpu_count{0};
};

struct MemoryCounters {
  uint64_t total_bytes{};
  uint64_t used_bytes{};
};

struct DiskCounters {
  std::string mount_id;   // mountpoint, e.g. /
  std::string fstype;     // e.g. ext4, xfs, btrfs
  uint64_t total_bytes{};
  uint64_t used_bytes{};
};

} // namespace vigil::model
