#include "system/HardwareWatchdog.h"

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/ioctl.h>
#include <unistd.h>

#include <linux/watchdog.h>

#include "utils/Log.h"

LinuxWatchdog::LinuxWatchdog(const char* device, int timeout_s)
: _device(device),
  _timeout_s(timeout_s)
{
}

LinuxWatchdog::~LinuxWatchdog() {
  if (_fd >= 0) ::close(_fd);
}

bool LinuxWatchdog::begin() {
  if (_fd >= 0) return true;

  _fd = ::open(_device, O_WRONLY | O_CLOEXEC);
  if (_fd < 0) {
    LOG_ERROR("Watchdog", "open(%s) failed: %s", _device, strerror(errno));
    return false;
  }

  int timeout = _timeout_s;
  if (::ioctl(_fd, WDIOC_SETTIMEOUT, &timeout) != 0) {
    // Some drivers only support their fixed timeout; keep going with it
    LOG_WARN("Watchdog", "WDIOC_SETTIMEOUT(%d) failed: %s", _timeout_s, strerror(errno));
  } else if (timeout != _timeout_s) {
    LOG_WARN("Watchdog", "Driver rounded timeout to %d s", timeout);
  }

  feed();
  LOG_INFO("Watchdog", "Armed %s (timeout %d s)", _device, timeout);
  return true;
}

void LinuxWatchdog::feed() {
  if (_fd < 0) return;

  if (::ioctl(_fd, WDIOC_KEEPALIVE, 0) != 0) {
    // Log once; the hardware will reset us if this keeps failing
    if (!_feed_failed) {
      LOG_ERROR("Watchdog", "WDIOC_KEEPALIVE failed: %s", strerror(errno));
      _feed_failed = true;
    }
    return;
  }
  _feed_failed = false;
}
