#include "collectors/ProcCounterSource.hpp"
#include "util/Errors.hpp"
#include "util/Procfs.hpp"

#include <sys/statvfs.h>

#include <algorithm>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_set>

namespace vigil::collectors {

namespace {

struct StatLine {
  uint64_t user{}, nice{}, system{}, idle{}, iowait{}, irq{}, softirq{}, steal{};
};

// Parse the numeric fields after a "cpu"/"cpuN" label. Returns false if the
// line carries fewer than the four mandatory fields.
bool parse_cpu_line(std::string_view line, StatLine& out) {
  auto pos = line.find(' ');
  if (pos == std::string_view::npos) return false;
  std::string_view rest = line.substr(pos + 1);
  uint64_t vals[8]{}; int i = 0;
  size_t start = 0;
  while (i < 8 && start < rest.size()) {
    while (start < rest.size() && (rest[start] == ' ' || rest[start] == '\t')) ++start;
    size_t end = start;
    while (end < rest.size() && rest[end] >= '0' && rest[end] <= '9') ++end;
    if (end == start) break;
    auto v = vigil::util::parse_u64(rest.substr(start, end - start));
    if (!v) break;
    vals[i++] = *v;
    start = end;
  }
  if (i < 4) return false;
  out.user = vals[0]; out.nice = vals[1]; out.system = vals[2]; out.idle = vals[3];
  out.iowait = vals[4]; out.irq = vals[5]; out.softirq = vals[6]; out.steal = vals[7];
  return true;
}

bool is_pseudo_fs(const std::string& fstype) {
  static const std::unordered_set<std::string> bad = {
    "proc","sysfs","devtmpfs","devpts","tmpfs","cgroup","cgroup2","pstore","securityfs",
    "bpf","autofs","mqueue","hugetlbfs","configfs","debugfs","tracefs","nsfs","ramfs",
    "fusectl","fuse.portal","overlay","squashfs","binfmt_misc","efivarfs","rpc_pipefs"
  };
  return bad.count(fstype) != 0;
}

} // namespace

vigil::model::CpuTicks ProcCounterSource::cpu_ticks() {
  auto txt_opt = vigil::util::read_file_string("/proc/stat");
  if (!txt_opt) throw vigil::SourceUnavailable("cannot read /proc/stat");
  const std::string& txt = *txt_opt;

  StatLine agg{};
  bool have_agg = false;
  int cores = 0;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start); if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("cpu ")) { have_agg = parse_cpu_line(line, agg); }
    else if (line.starts_with("cpu")) { ++cores; }
    else if (have_agg) break;
    start = end + 1;
  }
  if (!have_agg) throw vigil::SourceUnavailable("no aggregate cpu line in /proc/stat");

  vigil::model::CpuTicks t;
  t.user = agg.user + agg.nice;
  t.sys  = agg.system + agg.irq + agg.softirq + agg.steal;
  t.idle = agg.idle + agg.iowait;
  t.cpu_count = cores > 0 ? cores : 1;
  return t;
}

vigil::model::MemoryCounters ProcCounterSource::memory() {
  auto txt_opt = vigil::util::read_file_string("/proc/meminfo");
  if (!txt_opt) throw vigil::SourceUnavailable("cannot read /proc/meminfo");
  const std::string& txt = *txt_opt;

  uint64_t mem_total = 0, mem_free = 0, mem_avail = 0, buffers = 0, cached = 0;
  bool have_total = false, have_avail = false;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start);
    if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    auto field = [&](std::string_view key, uint64_t& dst) {
      if (!line.starts_with(key)) return false;
      auto v = vigil::util::parse_u64(line.substr(key.size()));
      if (v) dst = *v;
      return v.has_value();
    };
    if (field("MemTotal:", mem_total)) have_total = true;
    else if (field("MemAvailable:", mem_avail)) have_avail = true;
    else if (field("MemFree:", mem_free)) {}
    else if (field("Buffers:", buffers)) {}
    else if (field("Cached:", cached)) {}
    start = end + 1;
  }
  if (!have_total) throw vigil::SourceUnavailable("no MemTotal in /proc/meminfo");

  uint64_t used_kb = 0;
  if (have_avail) {
    used_kb = (mem_total > mem_avail) ? (mem_total - mem_avail) : 0;
  } else {
    uint64_t sum = mem_free + buffers + cached;
    used_kb = (mem_total > sum) ? (mem_total - sum) : 0;
  }
  return vigil::model::MemoryCounters{mem_total * 1024, used_kb * 1024};
}

std::vector<vigil::model::DiskCounters> ProcCounterSource::disks() {
  std::vector<vigil::model::DiskCounters> out;
  auto txt_opt = vigil::util::read_file_string("/proc/self/mounts");
  if (!txt_opt) return out;
  std::istringstream in(*txt_opt);
  std::string line;
  std::unordered_set<std::string> seen;
  while (std::getline(in, line)) {
    if (line.empty()) continue;
    std::istringstream ls(line);
    std::string device, mountpoint, fstype;
    if (!(ls >> device >> mountpoint >> fstype)) continue;
    if (is_pseudo_fs(fstype)) continue;
    // Bind mounts repeat the same mountpoint; keep the first
    if (!seen.insert(mountpoint).second) continue;

    struct statvfs vfs{};
    if (::statvfs(mountpoint.c_str(), &vfs) != 0) continue;
    uint64_t total = static_cast<uint64_t>(vfs.f_blocks) * vfs.f_frsize;
    uint64_t avail = static_cast<uint64_t>(vfs.f_bavail) * vfs.f_frsize;
    if (total == 0) continue;

    vigil::model::DiskCounters d;
    d.mount_id = mountpoint;
    d.fstype = fstype;
    d.total_bytes = total;
    d.used_bytes = (total > avail) ? (total - avail) : 0ULL;
    out.push_back(std::move(d));
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b){ return a.mount_id < b.mount_id; });
  return out;
}

} // namespace vigil::collectors
