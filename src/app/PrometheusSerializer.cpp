#include "app/PrometheusSerializer.hpp"
#include <charconv>
#include <chrono>
#include <cstdint>
#include <string_view>

namespace {

void append_double(std::string& out, double v) {
  char buf[32];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec == std::errc{}) out.append(buf, ptr);
  else out += '0';
}

void append_uint(std::string& out, uint64_t v) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

void append_escaped(std::string& out, std::string_view sv) {
  for (char c : sv) {
    if (c == '\\') out += "\\\\";
    else if (c == '"') out += "\\\"";
    else if (c == '\n') out += "\\n";
    else out += c;
  }
}

void emit_header(std::string& out, const char* name, const char* help, const char* type) {
  out += "# HELP ";  out += name;  out += ' ';  out += help;  out += '\n';
  out += "# TYPE ";  out += name;  out += ' ';  out += type;  out += '\n';
}

void emit_gauge_d(std::string& out, const char* name, double value) {
  out += name;  out += ' ';  append_double(out, value);  out += '\n';
}

void emit_gauge_u(std::string& out, const char* name, uint64_t value) {
  out += name;  out += ' ';  append_uint(out, value);  out += '\n';
}

// name{k1="v1",...} value; labels given as alternating key/value pairs
template <size_t N>
void emit_labeled(std::string& out, const char* name,
                  const std::string_view (&labels)[N], std::string_view value) {
  static_assert(N % 2 == 0, "labels are key/value pairs");
  out += name;  out += '{';
  for (size_t i = 0; i < N; i += 2) {
    if (i) out += ',';
    out += labels[i];  out += "=\"";  append_escaped(out, labels[i + 1]);  out += '"';
  }
  out += "} ";  out += value;  out += '\n';
}

std::string fmt_d(double v) { std::string s; append_double(s, v); return s; }
std::string fmt_u(uint64_t v) { std::string s; append_uint(s, v); return s; }

double direction_value(vigil::core::TrendDirection d) {
  switch (d) {
    case vigil::core::TrendDirection::Up: return 1.0;
    case vigil::core::TrendDirection::Down: return -1.0;
    case vigil::core::TrendDirection::Stable: break;
  }
  return 0.0;
}

void emit_series(std::string& out, std::string_view metric, std::string_view mount,
                 const vigil::core::SeriesTrend& t, bool forecast) {
  if (!forecast) {
    std::string_view labels[] = {"metric", metric, "mount", mount};
    emit_labeled(out, "vigil_trend_direction", labels, fmt_d(direction_value(t.direction)));
    return;
  }
  for (size_t i = 0; i < t.forecast.size(); ++i) {
    std::string step = fmt_u(i + 1);
    std::string_view labels[] = {"metric", metric, "mount", mount, "step", step};
    emit_labeled(out, "vigil_forecast_percent", labels, fmt_d(t.forecast[i]));
  }
}

} // anonymous namespace

namespace vigil::app {

std::string status_to_prometheus(const MonitorStatus& s, const vigil::core::TrendReport* trend) {
  std::string out;
  out.reserve(4096);

  emit_header(out, "vigil_up", "Whether the sampling timer is running", "gauge");
  emit_gauge_u(out, "vigil_up", s.running ? 1 : 0);

  {
    emit_header(out, "vigil_info", "Host the sampler runs on", "gauge");
    std::string_view labels[] = {"hostname", s.system.hostname, "ip", s.system.primary_ipv4,
                                 "os", s.system.os_name, "arch", s.system.arch, "source", s.source};
    emit_labeled(out, "vigil_info", labels, "1");
  }

  if (s.latest) {
    const auto& p = *s.latest;
    emit_header(out, "vigil_cpu_usage_percent", "Aggregate CPU utilization over the sample window", "gauge");
    emit_gauge_d(out, "vigil_cpu_usage_percent", p.cpu_usage_pct);
    emit_header(out, "vigil_cpu_user_percent", "CPU user time percent", "gauge");
    emit_gauge_d(out, "vigil_cpu_user_percent", p.cpu_user_pct);
    emit_header(out, "vigil_cpu_system_percent", "CPU system time percent", "gauge");
    emit_gauge_d(out, "vigil_cpu_system_percent", p.cpu_sys_pct);
    emit_header(out, "vigil_cpu_count", "Logical CPUs seen in /proc/stat", "gauge");
    emit_gauge_u(out, "vigil_cpu_count", static_cast<uint64_t>(p.cpu_count));

    emit_header(out, "vigil_memory_usage_percent", "Used share of physical memory", "gauge");
    emit_gauge_d(out, "vigil_memory_usage_percent", p.memory_usage_pct);
    emit_header(out, "vigil_memory_total_bytes", "Physical memory", "gauge");
    emit_gauge_u(out, "vigil_memory_total_bytes", p.memory_total_bytes);
    emit_header(out, "vigil_memory_used_bytes", "Physical memory in use", "gauge");
    emit_gauge_u(out, "vigil_memory_used_bytes", p.memory_used_bytes);

    if (!p.disk_usage_pct.empty()) {
      emit_header(out, "vigil_disk_usage_percent", "Used share per mounted filesystem", "gauge");
      for (const auto& [mount, pct] : p.disk_usage_pct) {
        std::string_view labels[] = {"mount", mount};
        emit_labeled(out, "vigil_disk_usage_percent", labels, fmt_d(pct));
      }
    }

    emit_header(out, "vigil_last_tick_timestamp_seconds", "Unix time of the newest sample", "gauge");
    auto secs = std::chrono::duration<double>(p.timestamp.time_since_epoch()).count();
    emit_gauge_d(out, "vigil_last_tick_timestamp_seconds", secs);
  }

  emit_header(out, "vigil_history_points", "Points held in the history buffer", "gauge");
  emit_gauge_u(out, "vigil_history_points", s.history_size);
  emit_header(out, "vigil_history_capacity", "History buffer capacity", "gauge");
  emit_gauge_u(out, "vigil_history_capacity", s.history_capacity);

  emit_header(out, "vigil_ticks_total", "Timer ticks by outcome", "counter");
  {
    std::string_view c[] = {"result", "completed"};
    emit_labeled(out, "vigil_ticks_total", c, fmt_u(s.ticks.completed));
    std::string_view f[] = {"result", "failed"};
    emit_labeled(out, "vigil_ticks_total", f, fmt_u(s.ticks.failed));
    std::string_view k[] = {"result", "skipped"};
    emit_labeled(out, "vigil_ticks_total", k, fmt_u(s.ticks.skipped));
  }

  emit_header(out, "vigil_alert_active", "Unresolved alerts", "gauge");
  for (const auto& a : s.active_alerts) {
    std::string_view labels[] = {"rule", a.rule_id, "level", vigil::model::to_string(a.level)};
    emit_labeled(out, "vigil_alert_active", labels, "1");
  }

  if (trend && trend->samples > 0) {
    emit_header(out, "vigil_trend_samples", "Points in the trend window", "gauge");
    emit_gauge_u(out, "vigil_trend_samples", trend->samples);
    emit_header(out, "vigil_trend_direction", "Trend over the window: 1 up, 0 stable, -1 down", "gauge");
    emit_series(out, "cpu", "", trend->cpu, false);
    emit_series(out, "memory", "", trend->memory, false);
    for (const auto& [mount, t] : trend->disks) emit_series(out, "disk", mount, t, false);
    emit_header(out, "vigil_forecast_percent", "Linear forecast, one step per sample interval", "gauge");
    emit_series(out, "cpu", "", trend->cpu, true);
    emit_series(out, "memory", "", trend->memory, true);
    for (const auto& [mount, t] : trend->disks) emit_series(out, "disk", mount, t, true);
  }

  return out;
}

} // namespace vigil::app
