#include "system/DeviceControl.h"

#include <errno.h>
#include <string.h>
#include <sys/reboot.h>
#include <unistd.h>

#include "utils/Log.h"

bool LinuxDeviceControl::reset() {
  LOG_WARN("System", "Resetting device");
  ::sync();

  if (::reboot(RB_AUTOBOOT) != 0) {
    LOG_ERROR("System", "reboot failed: %s", strerror(errno));
    return false;
  }
  return true;
}
