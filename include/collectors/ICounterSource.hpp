#pragma once
#include <vector>
#include "model/Counters.hpp"

namespace vigil::collectors {

// Raw counter provider consumed by DeltaSampler. Implementations throw
// vigil::SourceUnavailable when a read fails.
class ICounterSource {
public:
  virtual ~ICounterSource() = default;

  [[nodiscard]] virtual vigil::model::CpuTicks cpu_ticks() = 0;
  [[nodiscard]] virtual vigil::model::MemoryCounters memory() = 0;
  // May be empty; an unreadable mount table is reported as empty, not as an error.
  [[nodiscard]] virtual std::vector<vigil::model::DiskCounters> disks() = 0;

  // Human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

} // namespace vigil::collectors
