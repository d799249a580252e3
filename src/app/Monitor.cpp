#include "app/Monitor.hpp"

#include <algorithm>
#include <cstddef>
#include <stdexcept>

namespace vigil::app {

Monitor::Monitor(vigil::collectors::ICounterSource& source, MonitorConfig cfg)
    : source_(source), scheduler_(source, std::move(cfg)), system_(vigil::collectors::collect_system_info()) {}

// update_mu_ serializes lifecycle calls from outside threads. A listener
// callback must never wait on it: the holder may be joining that very thread.

bool Monitor::start() { return start(scheduler_.config()); }

bool Monitor::start(const MonitorConfig& cfg) {
  if (scheduler_.on_timer_thread()) throw std::logic_error("Monitor::start called from a listener callback");
  std::lock_guard<std::mutex> lk(update_mu_);
  return scheduler_.start(cfg);
}

void Monitor::stop() {
  if (scheduler_.on_timer_thread()) {
    scheduler_.stop();
    return;
  }
  std::lock_guard<std::mutex> lk(update_mu_);
  scheduler_.stop();
}

MonitorStatus Monitor::status() const {
  auto snap = scheduler_.snapshot();
  MonitorStatus st;
  st.running = scheduler_.running();
  st.config = scheduler_.config();
  st.system = system_;
  st.source = source_.name();
  st.history_size = snap->history.size();
  st.history_capacity = static_cast<size_t>(st.config.history_size);
  for (const auto& a : snap->alerts) {
    if (!a.resolved) st.active_alerts.push_back(a);
  }
  st.ticks = snap->ticks;
  if (!snap->history.empty()) st.latest = snap->history.back();
  st.last_tick_at = snap->last_tick_at;
  st.last_error = snap->last_error;
  return st;
}

std::vector<vigil::model::DataPoint> Monitor::history(size_t n) const {
  auto snap = scheduler_.snapshot();
  const auto& h = snap->history;
  size_t take = std::min(n, h.size());
  return std::vector<vigil::model::DataPoint>(h.end() - static_cast<std::ptrdiff_t>(take), h.end());
}

std::vector<vigil::model::DataPoint> Monitor::history() const {
  return scheduler_.snapshot()->history;
}

vigil::core::TrendReport Monitor::trend(std::chrono::minutes window) const {
  if (window.count() <= 0) throw std::invalid_argument("trend window must be positive");
  auto snap = scheduler_.snapshot();
  auto cutoff = std::chrono::system_clock::now() - window;
  std::vector<vigil::model::DataPoint> points;
  for (const auto& p : snap->history) {
    if (p.timestamp >= cutoff) points.push_back(p);
  }
  return vigil::core::analyze(points, scheduler_.config().trend);
}

std::vector<vigil::model::Alert> Monitor::active_alerts() const {
  std::vector<vigil::model::Alert> out;
  for (const auto& a : scheduler_.snapshot()->alerts) {
    if (!a.resolved) out.push_back(a);
  }
  return out;
}

std::vector<vigil::model::Alert> Monitor::alerts() const {
  return scheduler_.snapshot()->alerts;
}

MonitorConfig Monitor::update_config(const ConfigPatch& patch) {
  // Rejected up front so the running session is never torn down by a restart
  // that cannot happen from inside its own tick.
  if (scheduler_.on_timer_thread()) throw std::logic_error("Monitor::update_config called from a listener callback");
  std::lock_guard<std::mutex> lk(update_mu_);
  MonitorConfig next = apply_patch(scheduler_.config(), patch);
  if (scheduler_.running()) {
    // pause keeps the history across the config swap
    scheduler_.pause();
    scheduler_.start(next);
  } else {
    scheduler_.configure(next);
  }
  return next;
}

} // namespace vigil::app
