#pragma once
#include "collectors/ICounterSource.hpp"

namespace vigil::collectors {

// Linux counters: /proc/stat, /proc/meminfo, /proc/self/mounts + statvfs.
class ProcCounterSource : public ICounterSource {
public:
  ProcCounterSource() = default;
  [[nodiscard]] vigil::model::CpuTicks cpu_ticks() override;
  [[nodiscard]] vigil::model::MemoryCounters memory() override;
  [[nodiscard]] std::vector<vigil::model::DiskCounters> disks() override;
  [[nodiscard]] const char* name() const override { return "procfs"; }
};

} // namespace vigil::collectors
