#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>
#include "app/MonitorConfig.hpp"
#include "app/SnapshotBuffers.hpp"
#include "collectors/ICounterSource.hpp"
#include "core/AlertEvaluator.hpp"
#include "core/DeltaSampler.hpp"
#include "core/HistoryBuffer.hpp"

namespace vigil::app {

// Notification sink. Callbacks run on the thread that executed the tick,
// outside the session lock, in the order: alert events, then data.
class MonitorListener {
public:
  virtual ~MonitorListener() = default;
  virtual void on_alert(const vigil::model::AlertEvent& event) { (void)event; }
  virtual void on_data(const vigil::model::DataPoint& point) { (void)point; }
  virtual void on_tick_error(const std::string& what) { (void)what; }
};

enum class TickResult { Completed, Failed, Skipped };

// One monitoring session: a periodic timer thread driving
// sample -> history -> alert evaluation -> notify.
//
// Ticks never overlap. A tick that is due while another is still running
// (timer overrun, or collect_now racing the timer) is skipped and counted,
// never queued. Session state is only mutated under session_mu_, and every
// mutation republishes an immutable Snapshot for readers.
class Scheduler {
public:
  explicit Scheduler(vigil::collectors::ICounterSource& source, MonitorConfig cfg = {});
  ~Scheduler();
  Scheduler(const Scheduler&) = delete;
  Scheduler& operator=(const Scheduler&) = delete;

  // Validates and applies cfg, then starts the timer. Returns false (and
  // leaves config and timer untouched) when already running.
  bool start(const MonitorConfig& cfg);
  bool start() { return start(config()); }
  // Idempotent. Ends the session: when it returns no further timer tick will
  // run and the history is gone. Called from a listener callback it only
  // prevents further ticks; the thread is joined by the next
  // start/stop/destructor on another thread.
  void stop();
  // Like stop() but keeps the history, for a stop/start that swaps config.
  void pause();
  [[nodiscard]] bool running() const;
  // True inside a tick running on the timer thread (listener callbacks).
  [[nodiscard]] bool on_timer_thread() const;

  // Apply a validated config while stopped. Throws std::logic_error if running
  // or called from the timer thread.
  void configure(const MonitorConfig& cfg);
  [[nodiscard]] MonitorConfig config() const;

  // Extra rules evaluated after the threshold rules. Throws InvalidConfig on
  // a duplicate id.
  void add_rule(vigil::model::AlertRule rule);

  // Run one tick on the calling thread through the same reentrancy guard as
  // the timer.
  TickResult collect_now();

  void subscribe(MonitorListener& listener);
  void unsubscribe(MonitorListener& listener);

  void clear_history();
  void clear_alerts();

  [[nodiscard]] std::shared_ptr<const vigil::model::Snapshot> snapshot() const { return buffers_.front(); }

private:
  void halt(bool end_session);
  void run(std::stop_token st);
  TickResult tick(std::stop_token st);
  void install_rules_locked(std::chrono::system_clock::time_point now,
                            std::vector<vigil::model::AlertEvent>& events);
  void publish_locked();
  void notify(const std::vector<vigil::model::AlertEvent>& events,
              const vigil::model::DataPoint* point, const std::string* error);

  vigil::core::DeltaSampler sampler_;

  mutable std::mutex session_mu_;
  MonitorConfig config_;
  vigil::core::HistoryBuffer history_;
  vigil::core::AlertEvaluator alerts_;
  std::vector<vigil::model::AlertRule> extra_rules_;
  vigil::model::TickCounters counters_{};
  std::optional<std::chrono::system_clock::time_point> last_tick_at_;
  std::string last_error_;
  std::vector<MonitorListener*> listeners_;

  SnapshotBuffers buffers_;
  std::atomic<bool> in_tick_{false};

  std::mutex lifecycle_mu_;
  std::atomic<bool> running_{false};
  std::stop_source worker_stop_;
  std::atomic<std::thread::id> worker_id_{};
  std::jthread thread_;
};

} // namespace vigil::app
