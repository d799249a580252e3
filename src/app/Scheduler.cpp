#include "app/Scheduler.hpp"
#include "app/ThresholdRules.hpp"
#include "util/Errors.hpp"

#include <condition_variable>
#include <cstdio>
#include <exception>
#include <stdexcept>
#include <utility>

using namespace std::chrono;

namespace vigil::app {

namespace {
MonitorConfig validated(MonitorConfig cfg) {
  validate(cfg);
  return cfg;
}
} // namespace

// history_ is sized from config_, so config_ must be validated before it exists
Scheduler::Scheduler(vigil::collectors::ICounterSource& source, MonitorConfig cfg)
    : sampler_(source), config_(validated(std::move(cfg))), history_(static_cast<size_t>(config_.history_size)) {
  std::vector<vigil::model::AlertEvent> events;
  std::lock_guard<std::mutex> lk(session_mu_);
  install_rules_locked(system_clock::now(), events);
  publish_locked();
}

Scheduler::~Scheduler() { stop(); }

bool Scheduler::start(const MonitorConfig& cfg) {
  validate(cfg);
  // Checked before lifecycle_mu_: a stop() on another thread holds it while
  // joining this very thread.
  if (on_timer_thread()) throw std::logic_error("Scheduler::start called from its own tick");
  std::vector<vigil::model::AlertEvent> events;
  {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (running_.load()) return false;
    // Worker left over from a stop() issued inside a callback
    if (thread_.joinable()) thread_.join();
    {
      std::lock_guard<std::mutex> slk(session_mu_);
      config_ = cfg;
      history_.set_capacity(static_cast<size_t>(cfg.history_size));
      install_rules_locked(system_clock::now(), events);
      publish_locked();
    }
    worker_stop_ = std::stop_source{};
    running_.store(true);
    thread_ = std::jthread([this, tok = worker_stop_.get_token()]{ run(tok); });
    std::fprintf(stderr, "vigil: Scheduler: started (interval %dms, sample window %dms, history %d)\n",
                 cfg.interval_ms, cfg.sample_window_ms, cfg.history_size);
  }
  notify(events, nullptr, nullptr);
  return true;
}

void Scheduler::stop() { halt(true); }

void Scheduler::pause() { halt(false); }

void Scheduler::halt(bool end_session) {
  if (on_timer_thread()) {
    // Inside a tick callback: joining ourselves is impossible, so only make
    // sure the loop exits once this tick returns.
    running_.store(false);
    worker_stop_.request_stop();
    if (end_session) clear_history();
    return;
  }
  std::lock_guard<std::mutex> lk(lifecycle_mu_);
  running_.store(false);
  if (!thread_.joinable()) return;
  worker_stop_.request_stop();
  thread_.join();
  if (end_session) clear_history();
  std::fprintf(stderr, "vigil: Scheduler: %s\n", end_session ? "stopped" : "paused");
}

bool Scheduler::running() const { return running_.load(); }

bool Scheduler::on_timer_thread() const {
  return std::this_thread::get_id() == worker_id_.load();
}

void Scheduler::configure(const MonitorConfig& cfg) {
  validate(cfg);
  if (on_timer_thread()) throw std::logic_error("Scheduler::configure called from its own tick");
  std::vector<vigil::model::AlertEvent> events;
  {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (running_.load()) throw std::logic_error("Scheduler::configure while running; stop first");
    std::lock_guard<std::mutex> slk(session_mu_);
    config_ = cfg;
    history_.set_capacity(static_cast<size_t>(cfg.history_size));
    install_rules_locked(system_clock::now(), events);
    publish_locked();
  }
  notify(events, nullptr, nullptr);
}

MonitorConfig Scheduler::config() const {
  std::lock_guard<std::mutex> lk(session_mu_);
  return config_;
}

void Scheduler::add_rule(vigil::model::AlertRule rule) {
  std::vector<vigil::model::AlertEvent> events;
  {
    std::lock_guard<std::mutex> lk(session_mu_);
    extra_rules_.push_back(std::move(rule));
    try {
      install_rules_locked(system_clock::now(), events);
    } catch (const vigil::InvalidConfig&) {
      extra_rules_.pop_back();
      throw;
    }
  }
  notify(events, nullptr, nullptr);
}

void Scheduler::install_rules_locked(system_clock::time_point now,
                                     std::vector<vigil::model::AlertEvent>& events) {
  auto rules = make_threshold_rules(config_);
  rules.insert(rules.end(), extra_rules_.begin(), extra_rules_.end());
  if (!config_.alerts_enabled) {
    // Still reject a bad rule set, but install nothing: that resolves
    // whatever is firing so it cannot stay active while unevaluated.
    vigil::core::AlertEvaluator staged;
    (void)staged.set_rules(std::move(rules), now);
    rules.clear();
  }
  auto resolved = alerts_.set_rules(std::move(rules), now);
  events.insert(events.end(), resolved.begin(), resolved.end());
}

TickResult Scheduler::collect_now() { return tick(std::stop_token{}); }

void Scheduler::subscribe(MonitorListener& listener) {
  std::lock_guard<std::mutex> lk(session_mu_);
  for (auto* l : listeners_) if (l == &listener) return;
  listeners_.push_back(&listener);
}

void Scheduler::unsubscribe(MonitorListener& listener) {
  std::lock_guard<std::mutex> lk(session_mu_);
  std::erase(listeners_, &listener);
}

void Scheduler::clear_history() {
  std::lock_guard<std::mutex> lk(session_mu_);
  history_.clear();
  publish_locked();
}

void Scheduler::clear_alerts() {
  std::lock_guard<std::mutex> lk(session_mu_);
  alerts_.clear();
  publish_locked();
}

void Scheduler::publish_locked() {
  vigil::model::Snapshot s;
  s.history = history_.all();
  s.alerts = alerts_.alerts();
  s.ticks = counters_;
  s.last_tick_at = last_tick_at_;
  s.last_error = last_error_;
  buffers_.publish(std::move(s));
}

void Scheduler::notify(const std::vector<vigil::model::AlertEvent>& events,
                       const vigil::model::DataPoint* point, const std::string* error) {
  if (events.empty() && !point && !error) return;
  std::vector<MonitorListener*> targets;
  {
    std::lock_guard<std::mutex> lk(session_mu_);
    targets = listeners_;
  }
  for (auto* l : targets) {
    try {
      for (const auto& ev : events) l->on_alert(ev);
      if (point) l->on_data(*point);
      if (error) l->on_tick_error(*error);
    } catch (const std::exception& e) {
      std::fprintf(stderr, "vigil: Scheduler: listener threw: %s\n", e.what());
    }
  }
}

TickResult Scheduler::tick(std::stop_token st) {
  bool expected = false;
  if (!in_tick_.compare_exchange_strong(expected, true)) {
    {
      std::lock_guard<std::mutex> lk(session_mu_);
      ++counters_.skipped;
      publish_locked();
    }
    std::fprintf(stderr, "vigil: Scheduler: tick skipped, previous tick still running\n");
    return TickResult::Skipped;
  }
  struct InTickReset {
    std::atomic<bool>& flag;
    ~InTickReset() { flag.store(false); }
  } reset{in_tick_};

  milliseconds window{};
  bool alerts_on = true;
  {
    std::lock_guard<std::mutex> lk(session_mu_);
    window = milliseconds(config_.sample_window_ms);
    alerts_on = config_.alerts_enabled;
  }

  vigil::model::DataPoint point;
  std::string error;
  bool failed = false;
  try {
    point = sampler_.sample(window, st);
  } catch (const vigil::SamplingError& e) {
    failed = true;
    error = e.what();
  } catch (const std::exception& e) {
    failed = true;
    error = std::string("counter source failed: ") + e.what();
  } catch (...) {
    failed = true;
    error = "counter source failed: unknown exception";
  }

  if (failed) {
    // Interrupted by stop(): the session is going away, not a source failure
    if (st.stop_requested()) return TickResult::Skipped;
    {
      std::lock_guard<std::mutex> lk(session_mu_);
      ++counters_.failed;
      last_error_ = error;
      publish_locked();
    }
    std::fprintf(stderr, "vigil: Scheduler: tick failed: %s\n", error.c_str());
    notify({}, nullptr, &error);
    return TickResult::Failed;
  }

  std::vector<vigil::model::AlertEvent> events;
  {
    std::lock_guard<std::mutex> lk(session_mu_);
    history_.push(point);
    if (alerts_on) events = alerts_.evaluate(point);
    ++counters_.completed;
    last_tick_at_ = point.timestamp;
    publish_locked();
  }
  notify(events, &point, nullptr);
  return TickResult::Completed;
}

void Scheduler::run(std::stop_token st) {
  worker_id_.store(std::this_thread::get_id());
  milliseconds interval{};
  {
    std::lock_guard<std::mutex> lk(session_mu_);
    interval = milliseconds(config_.interval_ms);
  }
  std::mutex wait_mu;
  std::condition_variable_any wait_cv;
  auto next = steady_clock::now();
  while (!st.stop_requested()) {
    {
      // Nothing notifies wait_cv; it wakes on the deadline or on stop
      std::unique_lock<std::mutex> lk(wait_mu);
      (void)wait_cv.wait_until(lk, st, next, []{ return false; });
    }
    if (st.stop_requested()) break;
    (void)tick(st);
    next += interval;
    auto now = steady_clock::now();
    if (now >= next) {
      // Overran one or more periods: drop them instead of firing back to back
      auto missed = (now - next) / interval + 1;
      next += interval * missed;
      {
        std::lock_guard<std::mutex> lk(session_mu_);
        counters_.skipped += static_cast<uint64_t>(missed);
        publish_locked();
      }
      std::fprintf(stderr, "vigil: Scheduler: tick overran %lldms interval, skipped %lld due tick(s)\n",
                   static_cast<long long>(interval.count()), static_cast<long long>(missed));
    }
  }
  worker_id_.store(std::thread::id{});
}

} // namespace vigil::app
