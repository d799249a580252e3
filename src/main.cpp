#include "app/Config.hpp"
#include "app/Monitor.hpp"
#include "app/PrometheusSerializer.hpp"
#include "collectors/ProcCounterSource.hpp"
#include "core/TrendAnalyzer.hpp"
#include "util/Errors.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <string>
#include <thread>

using namespace std::chrono_literals;

static std::atomic<bool> g_stop{false};
static void on_sigint(int) { g_stop.store(true); }

static const char* kUsage =
    "Usage: vigil [--config PATH] [--interval-ms N] [--sample-window-ms N] [--history N]\n"
    "             [--threshold KEY=PCT]... [--no-alerts] [--iterations N] [--format text|prom]\n"
    "KEY is cpu|memory|disk, optionally with .info|.warning|.error|.critical\n"
    "Runs until Ctrl+C unless --iterations is given.\n";

static std::string clock_text(std::chrono::system_clock::time_point tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  localtime_r(&t, &tm);
  char buf[16];
  std::strftime(buf, sizeof(buf), "%H:%M:%S", &tm);
  return buf;
}

namespace {

// Prints ticks and alert transitions as they arrive on the timer thread.
class ConsoleListener : public vigil::app::MonitorListener {
public:
  explicit ConsoleListener(bool print_points) : print_points_(print_points) {}

  void on_alert(const vigil::model::AlertEvent& ev) override {
    const auto& a = ev.alert;
    if (ev.kind == vigil::model::AlertEventKind::Raised) {
      std::printf("%s ALERT  [%s] %s: %s\n", clock_text(a.first_fired_at).c_str(),
                  vigil::model::to_string(a.level), a.rule_id.c_str(), a.message.c_str());
    } else {
      auto at = a.resolved_at.value_or(std::chrono::system_clock::now());
      std::printf("%s CLEAR  [%s] %s\n", clock_text(at).c_str(),
                  vigil::model::to_string(a.level), a.rule_id.c_str());
    }
    std::fflush(stdout);
  }

  void on_data(const vigil::model::DataPoint& p) override {
    if (print_points_) {
      std::string line = clock_text(p.timestamp);
      char buf[96];
      std::snprintf(buf, sizeof(buf), " cpu %5.1f%% (usr %4.1f sys %4.1f)  mem %5.1f%%",
                    p.cpu_usage_pct, p.cpu_user_pct, p.cpu_sys_pct, p.memory_usage_pct);
      line += buf;
      for (const auto& [mount, pct] : p.disk_usage_pct) {
        std::snprintf(buf, sizeof(buf), "  %s %.1f%%", mount.c_str(), pct);
        line += buf;
      }
      std::printf("%s\n", line.c_str());
      std::fflush(stdout);
    }
    ticks_.fetch_add(1);
  }

  int ticks() const { return ticks_.load(); }

private:
  bool print_points_;
  std::atomic<int> ticks_{0};
};

void print_series(const char* label, const vigil::core::SeriesTrend& t) {
  std::printf("  %-12s %-6s latest %5.1f%%  mean %5.1f%%  min %5.1f%%  max %5.1f%%", label,
              vigil::core::to_string(t.direction), t.latest, t.mean, t.min, t.max);
  if (!t.forecast.empty()) {
    std::printf("  forecast");
    for (double v : t.forecast) std::printf(" %.1f", v);
  }
  std::printf("\n");
}

void print_summary(const vigil::app::MonitorStatus& st, const vigil::core::TrendReport& tr) {
  std::printf("\n%s (%s %s, %s, %d cpus) ip %s\n", st.system.hostname.c_str(), st.system.os_name.c_str(),
              st.system.os_release.c_str(), st.system.arch.c_str(), st.system.logical_cpus,
              st.system.primary_ipv4.c_str());
  std::printf("ticks: %llu completed, %llu failed, %llu skipped; history %zu/%zu\n",
              static_cast<unsigned long long>(st.ticks.completed),
              static_cast<unsigned long long>(st.ticks.failed),
              static_cast<unsigned long long>(st.ticks.skipped), st.history_size, st.history_capacity);
  if (!st.last_error.empty()) std::printf("last error: %s\n", st.last_error.c_str());
  std::printf("trend over %zu samples:\n", tr.samples);
  print_series("cpu", tr.cpu);
  print_series("memory", tr.memory);
  for (const auto& [mount, t] : tr.disks) print_series(mount.c_str(), t);
  if (st.active_alerts.empty()) {
    std::printf("no active alerts\n");
  } else {
    std::printf("active alerts:\n");
    for (const auto& a : st.active_alerts) {
      std::printf("  [%s] %s: %s\n", vigil::model::to_string(a.level), a.rule_id.c_str(), a.message.c_str());
    }
  }
}

} // namespace

int main(int argc, char** argv) {
  std::signal(SIGINT, on_sigint);
  std::signal(SIGTERM, on_sigint);

  std::string config_path;
  std::string format = "text";
  int iterations = 0; // 0 => run until Ctrl+C
  vigil::app::ConfigPatch patch;
  vigil::app::MonitorConfig cfg;
  try {
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      auto value = [&]() -> std::string {
        if (i + 1 >= argc) throw vigil::InvalidConfig(a + ": missing value");
        return argv[++i];
      };
      if (a == "--config") config_path = value();
      else if (a == "--interval-ms") patch.interval_ms = vigil::app::parse_int_value(value(), a);
      else if (a == "--sample-window-ms") patch.sample_window_ms = vigil::app::parse_int_value(value(), a);
      else if (a == "--history") patch.history_size = vigil::app::parse_int_value(value(), a);
      else if (a == "--threshold") vigil::app::parse_threshold_assignment(value(), patch);
      else if (a == "--no-alerts") patch.alerts_enabled = false;
      else if (a == "--iterations") {
        iterations = vigil::app::parse_int_value(value(), a);
        if (iterations < 0) throw vigil::InvalidConfig("--iterations: must not be negative");
      } else if (a == "--format") {
        format = value();
        if (format != "text" && format != "prom") throw vigil::InvalidConfig("--format: expected text or prom, got '" + format + "'");
      } else if (a == "-h" || a == "--help") {
        std::cout << kUsage;
        return 0;
      } else {
        throw vigil::InvalidConfig("unknown argument '" + a + "'");
      }
    }
    cfg = vigil::app::apply_patch(vigil::app::load_config(config_path), patch);
  } catch (const vigil::InvalidConfig& e) {
    std::fprintf(stderr, "vigil: %s\n%s", e.what(), kUsage);
    return 2;
  }

  vigil::collectors::ProcCounterSource source;
  vigil::app::Monitor monitor(source, cfg);
  ConsoleListener console(format == "text");
  monitor.subscribe(console);
  monitor.start();

  while (!g_stop.load() && monitor.running()) {
    if (iterations > 0 && console.ticks() >= iterations) break;
    std::this_thread::sleep_for(50ms);
  }
  monitor.unsubscribe(console);

  // Read the summary while the session still holds its history; stop drops it
  auto st = monitor.status();
  // Window covering the whole history buffer
  auto span_ms = static_cast<double>(cfg.history_size) * cfg.interval_ms;
  auto window = std::chrono::minutes(std::max<long long>(1, static_cast<long long>(std::ceil(span_ms / 60000.0))));
  auto tr = monitor.trend(window);
  monitor.stop();
  st.running = false;
  if (format == "prom") {
    std::cout << vigil::app::status_to_prometheus(st, &tr);
  } else {
    print_summary(st, tr);
  }
  return 0;
}
