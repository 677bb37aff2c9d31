#pragma once
#include <string>

#include "system/HardwareWatchdog.h"

/*
  NetworkLink.h

  Purpose:
  The uplink the operator console reaches us through. Joining the network
  (SSID, credentials) is owned by the OS; this layer waits for the link to
  come up, with bounded retries, and reports the address we are reachable on.
*/

class NetworkLink {
public:
  virtual ~NetworkLink() = default;

  virtual bool isUp() const = 0;

  // Wait for the link with up to LINK_MAX_RETRIES checks LINK_RETRY_DELAY_MS
  // apart. The watchdog is fed while waiting. False if the link never came up.
  virtual bool connect(HardwareWatchdog& watchdog) = 0;
};

class LinuxNetworkLink : public NetworkLink {
public:
  // ifname: interface to watch; empty means any non-loopback interface
  explicit LinuxNetworkLink(const std::string& ifname);

  bool isUp() const override;
  bool connect(HardwareWatchdog& watchdog) override;

private:
  // IPv4 address of the first matching running interface ("" if none)
  std::string address_() const;

  std::string _ifname;
};
