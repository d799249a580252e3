#include "app/SnapshotBuffers.hpp"

#include <utility>

namespace vigil::app {

SnapshotBuffers::SnapshotBuffers() : front_(std::make_shared<const vigil::model::Snapshot>()) {}

void SnapshotBuffers::publish(vigil::model::Snapshot next) {
  // single writer: reading seq outside the lock cannot race another publish
  next.seq = front()->seq + 1;
  auto ptr = std::make_shared<const vigil::model::Snapshot>(std::move(next));
  std::lock_guard<std::mutex> lk(mu_);
  front_.swap(ptr);
  // old snapshot released after unlock when the last reader drops it
}

std::shared_ptr<const vigil::model::Snapshot> SnapshotBuffers::front() const {
  std::lock_guard<std::mutex> lk(mu_);
  return front_;
}

} // namespace vigil::app
