#pragma once

#include <cctype>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vigil::util {

// Reader for the flat subset of TOML used by config.toml:
// [section] headers, key = value pairs, '#' comments, quoted strings.
// Values are kept as raw text; typed parsing is left to the caller so that
// malformed values can be rejected instead of silently defaulted.
class TomlReader {
public:
  bool load(const std::string& path) {
    sections_.clear();
    bad_lines_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string current_section;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
      ++lineno;
      auto sv = trim(strip_comment(line));
      if (sv.empty()) continue;
      if (sv.front() == '[' && sv.back() == ']') {
        current_section = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos) { bad_lines_.push_back(lineno); continue; }
      std::string key(trim(sv.substr(0, eq)));
      std::string val(trim(sv.substr(eq + 1)));
      if (key.empty()) { bad_lines_.push_back(lineno); continue; }
      // Quoted keys ("disk./data" = 70) and quoted string values
      key = unquote(key);
      val = unquote(val);
      ensure_section(current_section).set(key, val);
    }
    return true;
  }

  [[nodiscard]] std::optional<std::string> raw(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    if (!s) return std::nullopt;
    return s->get(key);
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const {
    auto v = raw(section, key);
    return v ? *v : def;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    return raw(section, key).has_value();
  }

  // Keys of a section in file order; empty if the section is absent.
  [[nodiscard]] std::vector<std::string> keys(std::string_view section) const {
    std::vector<std::string> out;
    if (const auto* s = find_section(section)) {
      for (const auto& [k, v] : s->entries) out.push_back(k);
    }
    return out;
  }

  // 1-based line numbers that were neither headers nor key = value pairs.
  [[nodiscard]] const std::vector<int>& bad_lines() const { return bad_lines_; }

private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries;

    [[nodiscard]] std::optional<std::string> get(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return v;
      return std::nullopt;
    }

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;
  std::vector<int> bad_lines_;

  Section& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] const Section* find_section(std::string_view name) const {
    for (const auto& [n, s] : sections_)
      if (n == name) return &s;
    return nullptr;
  }

  // Drop a trailing '#' comment that is not inside a quoted string
  static std::string_view strip_comment(std::string_view sv) {
    bool in_quotes = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '"') in_quotes = !in_quotes;
      else if (sv[i] == '#' && !in_quotes) return sv.substr(0, i);
    }
    return sv;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  static std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s.front() == '"' && s.back() == '"') return s.substr(1, s.size() - 2);
    return s;
  }
};

} // namespace vigil::util
