#pragma once
#include <cstddef>
#include <vector>
#include "model/DataPoint.hpp"

namespace vigil::core {

// Fixed-capacity ring of DataPoints, oldest evicted first. Not synchronized:
// the owning session serializes every call.
class HistoryBuffer {
public:
  explicit HistoryBuffer(size_t capacity);

  void push(vigil::model::DataPoint point);
  // Last min(n, size()) points, oldest first.
  [[nodiscard]] std::vector<vigil::model::DataPoint> recent(size_t n) const;
  [[nodiscard]] std::vector<vigil::model::DataPoint> all() const { return recent(size_); }
  void clear();

  // Change capacity, keeping the most recent points that still fit.
  void set_capacity(size_t capacity);

  [[nodiscard]] size_t size() const { return size_; }
  [[nodiscard]] size_t capacity() const { return slots_.size(); }
  [[nodiscard]] bool empty() const { return size_ == 0; }

private:
  std::vector<vigil::model::DataPoint> slots_;
  size_t head_{0}; // index of the oldest point
  size_t size_{0};
};

} // namespace vigil::core
