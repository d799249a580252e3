#include "core/HistoryBuffer.hpp"
#include "util/Errors.hpp"

#include <algorithm>
#include <utility>

namespace vigil::core {

HistoryBuffer::HistoryBuffer(size_t capacity) {
  if (capacity == 0) throw vigil::InvalidConfig("history capacity must be positive");
  slots_.resize(capacity);
}

void HistoryBuffer::push(vigil::model::DataPoint point) {
  const size_t cap = slots_.size();
  if (size_ < cap) {
    slots_[(head_ + size_) % cap] = std::move(point);
    ++size_;
  } else {
    // Full: overwrite the oldest slot and advance head
    slots_[head_] = std::move(point);
    head_ = (head_ + 1) % cap;
  }
}

std::vector<vigil::model::DataPoint> HistoryBuffer::recent(size_t n) const {
  n = std::min(n, size_);
  std::vector<vigil::model::DataPoint> out;
  out.reserve(n);
  const size_t cap = slots_.size();
  for (size_t i = size_ - n; i < size_; ++i) out.push_back(slots_[(head_ + i) % cap]);
  return out;
}

void HistoryBuffer::clear() {
  for (auto& s : slots_) s = vigil::model::DataPoint{};
  head_ = 0;
  size_ = 0;
}

void HistoryBuffer::set_capacity(size_t capacity) {
  if (capacity == 0) throw vigil::InvalidConfig("history capacity must be positive");
  if (capacity == slots_.size()) return;
  auto kept = recent(capacity);
  slots_.assign(capacity, vigil::model::DataPoint{});
  head_ = 0;
  size_ = kept.size();
  std::move(kept.begin(), kept.end(), slots_.begin());
}

} // namespace vigil::core
