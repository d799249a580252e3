#include "collectors/SystemInfo.hpp"

#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/utsname.h>
#include <unistd.h>

#include <cerrno>
#include <climits>
#include <cstdio>
#include <cstring>

namespace vigil::collectors {

static std::string first_external_ipv4() {
  struct ifaddrs* ifa_list = nullptr;
  if (::getifaddrs(&ifa_list) != 0) {
    std::fprintf(stderr, "vigil: SystemInfo: getifaddrs failed: %s\n", std::strerror(errno));
    return "127.0.0.1";
  }
  std::string found;
  for (auto* ifa = ifa_list; ifa && found.empty(); ifa = ifa->ifa_next) {
    if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
    if (ifa->ifa_flags & IFF_LOOPBACK) continue;
    char buf[INET_ADDRSTRLEN];
    const auto* sin = reinterpret_cast<const struct sockaddr_in*>(ifa->ifa_addr);
    if (::inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) found = buf;
  }
  ::freeifaddrs(ifa_list);
  return found.empty() ? std::string("127.0.0.1") : found;
}

SystemInfo collect_system_info() {
  SystemInfo info;
  char host[HOST_NAME_MAX + 1]{};
  if (::gethostname(host, sizeof(host) - 1) == 0) info.hostname = host;
  struct utsname u{};
  if (::uname(&u) == 0) {
    info.os_name = u.sysname;
    info.os_release = u.release;
    info.arch = u.machine;
  }
  long n = ::sysconf(_SC_NPROCESSORS_ONLN);
  info.logical_cpus = n > 0 ? static_cast<int>(n) : 1;
  info.primary_ipv4 = first_external_ipv4();
  return info;
}

} // namespace vigil::collectors
