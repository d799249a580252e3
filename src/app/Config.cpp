#include "app/Config.hpp"
#include "util/Errors.hpp"
#include "util/TomlReader.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <optional>
#include <string>

namespace vigil::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("VIGIL_", 0) == 0) {
    alt = std::string("vigil_") + n.substr(6);
  } else if (n.rfind("vigil_", 0) == 0) {
    alt = std::string("VIGIL_") + n.substr(6);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

static std::string_view trim(std::string_view sv) {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r')) sv.remove_suffix(1);
  return sv;
}

[[noreturn]] static void reject(std::string_view what, std::string_view text, const char* expected) {
  throw vigil::InvalidConfig(std::string(what) + ": expected " + expected + ", got '" + std::string(text) + "'");
}

int parse_int_value(std::string_view text, std::string_view what) {
  auto sv = trim(text);
  int v = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
  if (sv.empty() || ec != std::errc{} || ptr != sv.data() + sv.size()) reject(what, text, "an integer");
  return v;
}

double parse_double_value(std::string_view text, std::string_view what) {
  auto sv = trim(text);
  double v = 0.0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
  if (sv.empty() || ec != std::errc{} || ptr != sv.data() + sv.size() || !std::isfinite(v)) {
    reject(what, text, "a number");
  }
  return v;
}

bool parse_bool_value(std::string_view text, std::string_view what) {
  auto sv = trim(text);
  if (sv == "true" || sv == "True" || sv == "TRUE" || sv == "1" || sv == "yes" || sv == "on") return true;
  if (sv == "false" || sv == "False" || sv == "FALSE" || sv == "0" || sv == "no" || sv == "off") return false;
  reject(what, text, "true or false");
}

void parse_threshold_assignment(std::string_view text, ConfigPatch& patch) {
  auto eq = text.find('=');
  if (eq == std::string_view::npos) reject("threshold", text, "KEY=PERCENT");
  std::string key(trim(text.substr(0, eq)));
  if (!parse_threshold_key(key)) throw vigil::InvalidConfig("unknown threshold '" + key + "'");
  patch.thresholds[key] = parse_double_value(text.substr(eq + 1), "threshold " + key);
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/vigil/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/vigil/config.toml";
  return {};
}

namespace {

struct Sources {
  vigil::util::TomlReader toml;
  bool have_toml{false};

  std::optional<std::string> lookup(const char* section, const char* key, const char* env_name) const {
    if (have_toml) {
      if (auto v = toml.raw(section, key)) return v;
    }
    if (env_name) {
      if (const char* v = getenv_compat(env_name)) return std::string(v);
    }
    return std::nullopt;
  }
};

std::string field_name(const char* section, const char* key) {
  return std::string(section) + "." + key;
}

// Resolve an int from TOML -> env -> compiled default
int resolve_int(const Sources& src, const char* section, const char* key, const char* env_name, int def) {
  auto v = src.lookup(section, key, env_name);
  return v ? parse_int_value(*v, field_name(section, key)) : def;
}

double resolve_double(const Sources& src, const char* section, const char* key, const char* env_name, double def) {
  auto v = src.lookup(section, key, env_name);
  return v ? parse_double_value(*v, field_name(section, key)) : def;
}

bool resolve_bool(const Sources& src, const char* section, const char* key, const char* env_name, bool def) {
  auto v = src.lookup(section, key, env_name);
  return v ? parse_bool_value(*v, field_name(section, key)) : def;
}

} // namespace

MonitorConfig load_config(const std::string& path) {
  Sources src;
  std::string file = path.empty() ? config_file_path() : path;
  if (!path.empty() && !std::filesystem::exists(path)) {
    throw vigil::InvalidConfig("config file not found: " + path);
  }
  if (!file.empty()) src.have_toml = src.toml.load(file);
  if (src.have_toml) {
    const auto& bad = src.toml.bad_lines();
    if (!bad.empty()) {
      throw vigil::InvalidConfig(file + ":" + std::to_string(bad.front()) + ": expected 'key = value'");
    }
  }

  MonitorConfig c{};
  // --- [monitor] ---
  c.interval_ms      = resolve_int(src, "monitor", "interval_ms",      "VIGIL_INTERVAL_MS", c.interval_ms);
  c.sample_window_ms = resolve_int(src, "monitor", "sample_window_ms", "VIGIL_SAMPLE_WINDOW_MS", c.sample_window_ms);
  c.history_size     = resolve_int(src, "monitor", "history_size",     "VIGIL_HISTORY_SIZE", c.history_size);
  c.alerts_enabled   = resolve_bool(src, "monitor", "alerts_enabled",  "VIGIL_ALERTS_ENABLED", c.alerts_enabled);

  // --- [thresholds] --- defaults, then per-metric env, then every key of the file section
  c.thresholds["cpu"]    = resolve_double(src, "thresholds", "cpu",    "VIGIL_THRESHOLD_CPU", c.thresholds["cpu"]);
  c.thresholds["memory"] = resolve_double(src, "thresholds", "memory", "VIGIL_THRESHOLD_MEMORY", c.thresholds["memory"]);
  c.thresholds["disk"]   = resolve_double(src, "thresholds", "disk",   "VIGIL_THRESHOLD_DISK", c.thresholds["disk"]);
  if (src.have_toml) {
    for (const auto& key : src.toml.keys("thresholds")) {
      if (!parse_threshold_key(key)) throw vigil::InvalidConfig("unknown threshold '" + key + "' in " + file);
      c.thresholds[key] = parse_double_value(src.toml.get_string("thresholds", key), "thresholds." + key);
    }
  }

  // --- [trend] ---
  c.trend.relative_threshold  = resolve_double(src, "trend", "relative_threshold",  nullptr, c.trend.relative_threshold);
  c.trend.zero_mean_threshold = resolve_double(src, "trend", "zero_mean_threshold", nullptr, c.trend.zero_mean_threshold);
  c.trend.forecast_periods    = resolve_int(src, "trend", "forecast_periods",        nullptr, c.trend.forecast_periods);

  validate(c);
  return c;
}

} // namespace vigil::app
