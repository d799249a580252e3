#pragma once
#include <chrono>
#include <deque>
#include <mutex>
#include <thread>
#include <vector>
#include "collectors/ICounterSource.hpp"
#include "util/Errors.hpp"

namespace vigil::test {

// Scripted counter source. cpu_ticks() pops queued snapshots; once the queue
// runs dry every read advances the last snapshot by `step`.
class FakeCounterSource : public vigil::collectors::ICounterSource {
public:
  FakeCounterSource() {
    last_.cpu_count = 4;
    mem_.total_bytes = 1000;
    mem_.used_bytes = 500;
  }

  void queue_ticks(vigil::model::CpuTicks t) { std::lock_guard lk(mu_); queued_.push_back(t); }
  void set_step(vigil::model::CpuTicks step) { std::lock_guard lk(mu_); step_ = step; }
  void set_memory(uint64_t used, uint64_t total) { std::lock_guard lk(mu_); mem_ = {total, used}; }
  void set_disks(std::vector<vigil::model::DiskCounters> d) { std::lock_guard lk(mu_); disks_ = std::move(d); }
  void set_failing(bool f) { std::lock_guard lk(mu_); failing_ = f; }
  // Throw a value that is not a std::exception from cpu_ticks()
  void set_throw_foreign(bool f) { std::lock_guard lk(mu_); foreign_ = f; }
  void set_read_delay(std::chrono::milliseconds d) { std::lock_guard lk(mu_); delay_ = d; }
  int cpu_reads() const { std::lock_guard lk(mu_); return cpu_reads_; }

  vigil::model::CpuTicks cpu_ticks() override {
    std::chrono::milliseconds delay{};
    vigil::model::CpuTicks out;
    {
      std::lock_guard lk(mu_);
      ++cpu_reads_;
      if (failing_) throw vigil::SourceUnavailable("fake: cpu counters unavailable");
      if (foreign_) throw 42;
      delay = delay_;
      if (!queued_.empty()) {
        last_ = queued_.front();
        queued_.pop_front();
      } else {
        last_.user += step_.user;
        last_.sys += step_.sys;
        last_.idle += step_.idle;
      }
      out = last_;
    }
    if (delay.count() > 0) std::this_thread::sleep_for(delay);
    return out;
  }

  vigil::model::MemoryCounters memory() override {
    std::lock_guard lk(mu_);
    if (failing_) throw vigil::SourceUnavailable("fake: memory counters unavailable");
    return mem_;
  }

  std::vector<vigil::model::DiskCounters> disks() override {
    std::lock_guard lk(mu_);
    return disks_;
  }

  const char* name() const override { return "fake"; }

private:
  mutable std::mutex mu_;
  std::deque<vigil::model::CpuTicks> queued_;
  vigil::model::CpuTicks last_{};
  vigil::model::CpuTicks step_{10, 10, 80, 4};
  vigil::model::MemoryCounters mem_{};
  std::vector<vigil::model::DiskCounters> disks_;
  bool failing_{false};
  bool foreign_{false};
  std::chrono::milliseconds delay_{0};
  int cpu_reads_{0};
};

} // namespace vigil::test
