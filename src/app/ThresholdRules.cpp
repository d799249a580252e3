#include "app/ThresholdRules.hpp"

#include <cstdio>
#include <string>
#include <utility>

namespace vigil::app {

using vigil::model::AlertLevel;
using vigil::model::AlertRule;
using vigil::model::DataPoint;

namespace {

// Fullest mount of a point; nullptr when the point has no disks
const std::pair<const std::string, double>* fullest_mount(const DataPoint& p) {
  const std::pair<const std::string, double>* best = nullptr;
  for (const auto& kv : p.disk_usage_pct) {
    if (!best || kv.second > best->second) best = &kv;
  }
  return best;
}

std::string pct_text(double v) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%.1f%%", v);
  return buf;
}

AlertRule make_rule(const std::string& metric, AlertLevel level, double limit) {
  AlertRule r;
  r.id = metric + "." + vigil::model::to_string(level);
  r.level = level;
  if (metric == "cpu") {
    r.predicate = [limit](const DataPoint& p){ return p.cpu_usage_pct >= limit; };
    r.message = [limit](const DataPoint& p){
      return "CPU usage " + pct_text(p.cpu_usage_pct) + " >= " + pct_text(limit);
    };
  } else if (metric == "memory") {
    r.predicate = [limit](const DataPoint& p){ return p.memory_usage_pct >= limit; };
    r.message = [limit](const DataPoint& p){
      return "Memory usage " + pct_text(p.memory_usage_pct) + " >= " + pct_text(limit);
    };
  } else {
    r.predicate = [limit](const DataPoint& p){
      const auto* m = fullest_mount(p);
      return m && m->second >= limit;
    };
    r.message = [limit](const DataPoint& p){
      const auto* m = fullest_mount(p);
      if (!m) return std::string("Disk usage above ") + pct_text(limit);
      return "Disk " + m->first + " usage " + pct_text(m->second) + " >= " + pct_text(limit);
    };
  }
  return r;
}

} // namespace

std::vector<AlertRule> make_threshold_rules(const MonitorConfig& cfg) {
  static constexpr const char* metrics[] = {"cpu", "memory", "disk"};
  static constexpr AlertLevel levels[] = {
    AlertLevel::Info, AlertLevel::Warning, AlertLevel::Error, AlertLevel::Critical
  };
  std::vector<AlertRule> rules;
  for (const char* metric : metrics) {
    for (AlertLevel level : levels) {
      for (const auto& [key, pct] : cfg.thresholds) {
        auto k = parse_threshold_key(key);
        if (!k || k->metric != metric || k->level != level) continue;
        // "cpu" and "cpu.warning" name the same rule; the explicit form wins
        bool explicit_form = key.find('.') != std::string::npos;
        if (!explicit_form) {
          std::string spelled = std::string(metric) + "." + vigil::model::to_string(level);
          if (cfg.thresholds.count(spelled)) continue;
        }
        rules.push_back(make_rule(metric, level, pct));
      }
    }
  }
  return rules;
}

} // namespace vigil::app
