#pragma once
#include <string>

namespace vigil::collectors {

struct SystemInfo {
  std::string hostname;
  std::string primary_ipv4;  // first non-loopback IPv4, 127.0.0.1 if none
  std::string os_name;       // e.g. Linux
  std::string os_release;
  std::string arch;          // e.g. x86_64, aarch64
  int logical_cpus{0};
};

// Best effort: fields that cannot be determined are left empty.
[[nodiscard]] SystemInfo collect_system_info();

} // namespace vigil::collectors
