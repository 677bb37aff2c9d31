#include "system/NetworkLink.h"

#include <arpa/inet.h>
#include <errno.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <string.h>

#include "Params.h"
#include "utils/Clock.h"
#include "utils/Log.h"

// Slice retry sleeps so the watchdog keeps getting fed
static constexpr uint32_t LINK_WAIT_SLICE_MS = 250;

LinuxNetworkLink::LinuxNetworkLink(const std::string& ifname)
: _ifname(ifname)
{
}

std::string LinuxNetworkLink::address_() const {
  struct ifaddrs* list = nullptr;
  if (::getifaddrs(&list) != 0) {
    LOG_ERROR("Net", "getifaddrs failed: %s", strerror(errno));
    return std::string();
  }

  std::string found;
  for (struct ifaddrs* ifa = list; ifa; ifa = ifa->ifa_next) {
    if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;

    const unsigned flags = ifa->ifa_flags;
    if (!(flags & IFF_UP) || !(flags & IFF_RUNNING)) continue;

    if (_ifname.empty()) {
      if (flags & IFF_LOOPBACK) continue;
    } else if (_ifname != ifa->ifa_name) {
      continue;
    }

    char ip[INET_ADDRSTRLEN];
    const struct sockaddr_in* sin = (const struct sockaddr_in*)ifa->ifa_addr;
    if (inet_ntop(AF_INET, &sin->sin_addr, ip, sizeof(ip))) {
      found = ip;
      break;
    }
  }

  ::freeifaddrs(list);
  return found;
}

bool LinuxNetworkLink::isUp() const {
  return !address_().empty();
}

bool LinuxNetworkLink::connect(HardwareWatchdog& watchdog) {
  const char* name = _ifname.empty() ? "any" : _ifname.c_str();

  for (int attempt = 1; attempt <= LINK_MAX_RETRIES; attempt++) {
    const std::string ip = address_();
    if (!ip.empty()) {
      LOG_INFO("Net", "Link up on %s. IP: %s", name, ip.c_str());
      return true;
    }

    LOG_WARN("Net", "Link %s down, retrying (%d/%d)", name, attempt, LINK_MAX_RETRIES);

    for (uint32_t waited = 0; waited < LINK_RETRY_DELAY_MS; waited += LINK_WAIT_SLICE_MS) {
      watchdog.feed();
      delayMs(LINK_WAIT_SLICE_MS);
    }
  }

  LOG_ERROR("Net", "Link %s failed after %d attempts", name, LINK_MAX_RETRIES);
  return false;
}
