#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include "model/Snapshot.hpp"

namespace vigil::app {

// Single-writer publication point for session snapshots. Readers get a
// shared reference to an immutable copy and never see a partial update;
// the writer only holds the lock for a pointer swap.
class SnapshotBuffers {
public:
  SnapshotBuffers();
  // Non-copyable
  SnapshotBuffers(const SnapshotBuffers&) = delete;
  SnapshotBuffers& operator=(const SnapshotBuffers&) = delete;

  // Stamp seq and publish
  void publish(vigil::model::Snapshot next);

  [[nodiscard]] std::shared_ptr<const vigil::model::Snapshot> front() const;
  [[nodiscard]] uint64_t seq() const { return front()->seq; }

private:
  mutable std::mutex mu_;
  std::shared_ptr<const vigil::model::Snapshot> front_;
};

} // namespace vigil::app
