#include "util/Procfs.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string_view>

namespace vigil::util {

static std::string proc_root() {
  const char* env = std::getenv("VIGIL_PROC_ROOT");
  if (env && *env) return std::string(env);
  return std::string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) != 0) return abs; // not under /proc
  auto root = proc_root();
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_proc_path(abs));
  if (!in) return std::nullopt;
  std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  // File disappeared or became unreadable between open and read
  if (in.bad()) return std::nullopt;
  return s;
}

auto parse_u64(std::string_view sv) -> std::optional<unsigned long long> {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) sv.remove_prefix(1);
  while (!sv.empty() && (sv.back() < '0' || sv.back() > '9')) sv.remove_suffix(1);
  if (sv.empty()) return std::nullopt;
  unsigned long long v = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), v);
  if (ec != std::errc{} || ptr == sv.data()) return std::nullopt;
  return v;
}

} // namespace vigil::util
