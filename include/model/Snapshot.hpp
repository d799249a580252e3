#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "model/Alert.hpp"
#include "model/DataPoint.hpp"

namespace vigil::model {

struct TickCounters {
  uint64_t completed{};  // ticks that produced a DataPoint
  uint64_t failed{};     // ticks dropped on a sampling error
  uint64_t skipped{};    // due ticks not run (overrun or tick already in flight)
};

// Immutable copy of a monitoring session, published after every mutation.
struct Snapshot {
  uint64_t seq{};
  std::vector<DataPoint> history;   // oldest first
  std::vector<Alert> alerts;        // all records, rule order
  TickCounters ticks;
  std::optional<std::chrono::system_clock::time_point> last_tick_at;
  std::string last_error;
};

} // namespace vigil::model
