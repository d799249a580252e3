#include "minitest.hpp"
#include "collectors/ProcCounterSource.hpp"
#include "util/Errors.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path make_proc_root(const char* tag) {
  auto root = fs::temp_directory_path() / fs::path(std::string("vigil_test_proc_") + tag) /
              fs::path(std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root / "proc/self");
  setenv("VIGIL_PROC_ROOT", root.c_str(), 1);
  return root;
}

TEST(proc_cpu_ticks_fold_states) {
  auto root = make_proc_root("cpu");
  std::ofstream(root / "proc/stat") <<
    "cpu  100 5 50 1000 20 3 2 1 0 0\n"
    "cpu0 50 2 25 500 10 1 1 0 0 0\n"
    "cpu1 50 3 25 500 10 2 1 1 0 0\n"
    "intr 12345\n";
  vigil::collectors::ProcCounterSource src;
  auto t = src.cpu_ticks();
  ASSERT_EQ(t.user, 105u);
  ASSERT_EQ(t.sys, 56u);
  ASSERT_EQ(t.idle, 1020u);
  ASSERT_EQ(t.cpu_count, 2);
  unsetenv("VIGIL_PROC_ROOT");
}

TEST(proc_cpu_ticks_short_line) {
  auto root = make_proc_root("cpu_short");
  // Old kernels only report four fields
  std::ofstream(root / "proc/stat") << "cpu  10 0 10 80\n";
  vigil::collectors::ProcCounterSource src;
  auto t = src.cpu_ticks();
  ASSERT_EQ(t.user, 10u);
  ASSERT_EQ(t.idle, 80u);
  ASSERT_EQ(t.cpu_count, 1);
  unsetenv("VIGIL_PROC_ROOT");
}

TEST(proc_cpu_ticks_unavailable) {
  auto root = make_proc_root("cpu_missing");
  vigil::collectors::ProcCounterSource src;
  ASSERT_THROWS(src.cpu_ticks(), vigil::SourceUnavailable);
  std::ofstream(root / "proc/stat") << "intr 1\n";
  ASSERT_THROWS(src.cpu_ticks(), vigil::SourceUnavailable);
  unsetenv("VIGIL_PROC_ROOT");
}

TEST(proc_memory_prefers_available) {
  auto root = make_proc_root("mem");
  std::ofstream(root / "proc/meminfo") <<
    "MemTotal:       2097152 kB\n"
    "MemFree:         524288 kB\n"
    "MemAvailable:   1048576 kB\n"
    "Buffers:         131072 kB\n"
    "Cached:          262144 kB\n";
  vigil::collectors::ProcCounterSource src;
  auto m = src.memory();
  ASSERT_EQ(m.total_bytes, 2097152ull * 1024);
  ASSERT_EQ(m.used_bytes, 1048576ull * 1024);
  unsetenv("VIGIL_PROC_ROOT");
}

TEST(proc_memory_without_available) {
  auto root = make_proc_root("mem_old");
  std::ofstream(root / "proc/meminfo") <<
    "MemTotal:       1000 kB\n"
    "MemFree:         100 kB\n"
    "Buffers:         100 kB\n"
    "Cached:          200 kB\n";
  vigil::collectors::ProcCounterSource src;
  auto m = src.memory();
  ASSERT_EQ(m.used_bytes, 600ull * 1024);
  std::ofstream(root / "proc/meminfo") << "MemFree: 100 kB\n";
  ASSERT_THROWS(src.memory(), vigil::SourceUnavailable);
  unsetenv("VIGIL_PROC_ROOT");
}

TEST(proc_disks_filter_pseudo_and_duplicates) {
  auto root = make_proc_root("disk");
  std::ofstream(root / "proc/self/mounts") <<
    "proc /proc proc rw,nosuid 0 0\n"
    "tmpfs /run tmpfs rw 0 0\n"
    "/dev/sda1 / ext4 rw,relatime 0 0\n"
    "/dev/sda1 / ext4 rw,relatime 0 0\n"
    "/dev/sdz9 /vigil/does/not/exist xfs rw 0 0\n";
  vigil::collectors::ProcCounterSource src;
  auto d = src.disks();
  ASSERT_EQ(d.size(), 1u);
  ASSERT_EQ(d[0].mount_id, "/");
  ASSERT_EQ(d[0].fstype, "ext4");
  ASSERT_TRUE(d[0].total_bytes > 0);
  ASSERT_TRUE(d[0].used_bytes <= d[0].total_bytes);
  unsetenv("VIGIL_PROC_ROOT");
}

TEST(proc_disks_missing_mount_table_is_empty) {
  make_proc_root("disk_missing");
  vigil::collectors::ProcCounterSource src;
  ASSERT_TRUE(src.disks().empty());
  unsetenv("VIGIL_PROC_ROOT");
}
