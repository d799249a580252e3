#pragma once
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "app/MonitorConfig.hpp"
#include "app/Scheduler.hpp"
#include "collectors/ICounterSource.hpp"
#include "collectors/SystemInfo.hpp"
#include "core/TrendAnalyzer.hpp"
#include "model/Alert.hpp"
#include "model/DataPoint.hpp"
#include "model/Snapshot.hpp"

namespace vigil::app {

struct MonitorStatus {
  bool running{false};
  MonitorConfig config;
  vigil::collectors::SystemInfo system;
  std::string source;
  size_t history_size{0};
  size_t history_capacity{0};
  std::vector<vigil::model::Alert> active_alerts;
  vigil::model::TickCounters ticks;
  std::optional<vigil::model::DataPoint> latest;
  std::optional<std::chrono::system_clock::time_point> last_tick_at;
  std::string last_error;
};

// Public surface of a monitoring session. Owns the Scheduler; all reads go
// through its published snapshot so they never block a tick.
class Monitor {
public:
  explicit Monitor(vigil::collectors::ICounterSource& source, MonitorConfig cfg = {});
  Monitor(const Monitor&) = delete;
  Monitor& operator=(const Monitor&) = delete;

  // false when already running. Throws std::logic_error from a listener callback.
  bool start();
  bool start(const MonitorConfig& cfg);
  // Ends the session and drops its history. Safe from a listener callback.
  void stop();
  [[nodiscard]] bool running() const { return scheduler_.running(); }

  [[nodiscard]] MonitorStatus status() const;
  // Last min(n, size) points, oldest first
  [[nodiscard]] std::vector<vigil::model::DataPoint> history(size_t n) const;
  [[nodiscard]] std::vector<vigil::model::DataPoint> history() const;
  // Trend over points newer than now - window. Throws std::invalid_argument
  // for a non-positive window.
  [[nodiscard]] vigil::core::TrendReport trend(std::chrono::minutes window) const;
  [[nodiscard]] std::vector<vigil::model::Alert> active_alerts() const;
  [[nodiscard]] std::vector<vigil::model::Alert> alerts() const;

  void clear_history() { scheduler_.clear_history(); }
  void clear_alerts() { scheduler_.clear_alerts(); }

  // Stop, apply, restart if it was running; history survives the restart.
  // Returns the config now in effect. Throws InvalidConfig and leaves the
  // session untouched when the patched config is invalid, and
  // std::logic_error when called from a listener callback.
  MonitorConfig update_config(const ConfigPatch& patch);
  [[nodiscard]] MonitorConfig config() const { return scheduler_.config(); }

  TickResult collect_now() { return scheduler_.collect_now(); }
  void add_rule(vigil::model::AlertRule rule) { scheduler_.add_rule(std::move(rule)); }
  void subscribe(MonitorListener& l) { scheduler_.subscribe(l); }
  void unsubscribe(MonitorListener& l) { scheduler_.unsubscribe(l); }

  [[nodiscard]] const vigil::collectors::SystemInfo& system_info() const { return system_; }
  [[nodiscard]] std::shared_ptr<const vigil::model::Snapshot> snapshot() const { return scheduler_.snapshot(); }

private:
  vigil::collectors::ICounterSource& source_;
  Scheduler scheduler_;
  vigil::collectors::SystemInfo system_;
  std::mutex update_mu_;
};

} // namespace vigil::app
