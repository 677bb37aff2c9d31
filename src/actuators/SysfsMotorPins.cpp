#include "actuators/SysfsMotorPins.h"

#include <errno.h>
#include <fcntl.h>
#include <stdio.h>
#include <string.h>
#include <unistd.h>

#include "Params.h"
#include "utils/Log.h"

/*
  SysfsMotorPins.cpp

  Export is idempotent: EBUSY from an export file means the line is already
  exported (for example by a previous run) and is accepted.
*/

static bool writeSysfs(const std::string& path, const char* value, bool allow_busy = false) {
  const int fd = ::open(path.c_str(), O_WRONLY | O_CLOEXEC);
  if (fd < 0) {
    LOG_ERROR("Motor", "open(%s) failed: %s", path.c_str(), strerror(errno));
    return false;
  }

  const size_t len = strlen(value);
  const ssize_t n = ::write(fd, value, len);
  const int err = errno;
  ::close(fd);

  if (n == (ssize_t)len) return true;
  if (n < 0 && allow_busy && err == EBUSY) return true;

  LOG_ERROR("Motor", "write(%s, %s) failed: %s", path.c_str(), value, strerror(err));
  return false;
}

static void writeValue(int fd, const char* value) {
  if (fd < 0) return;
  const size_t len = strlen(value);
  if (::pwrite(fd, value, len, 0) != (ssize_t)len) {
    LOG_ERROR("Motor", "pwrite(fd=%d, %s) failed: %s", fd, value, strerror(errno));
  }
}

SysfsMotorPins::SysfsMotorPins(int gpio_in1, int gpio_in2, int pwm_chip, int pwm_channel)
: _gpio_in1(gpio_in1),
  _gpio_in2(gpio_in2),
  _pwm_chip(pwm_chip),
  _pwm_channel(pwm_channel)
{
  _pwm_dir = "/sys/class/pwm/pwmchip" + std::to_string(_pwm_chip) +
             "/pwm" + std::to_string(_pwm_channel);
}

SysfsMotorPins::~SysfsMotorPins() {
  // Leave the bridge coasting when we let go of it
  writeValue(_duty_fd, "0");
  writeValue(_in1_fd, "0");
  writeValue(_in2_fd, "0");
  closeAll_();
}

bool SysfsMotorPins::begin() {
  closeAll_();

  if (!exportGpio_(_gpio_in1, _in1_fd)) return false;
  if (!exportGpio_(_gpio_in2, _in2_fd)) return false;
  if (!exportPwm_()) return false;

  LOG_INFO("Motor", "Outputs ready: IN1=gpio%d IN2=gpio%d PWM=%s",
           _gpio_in1, _gpio_in2, _pwm_dir.c_str());
  return true;
}

void SysfsMotorPins::apply(const MotorOutputState& out) {
  char duty_ns[24];
  const uint64_t ns = (uint64_t)PWM_PERIOD_NS * out.duty / PWM_DUTY_MAX;
  snprintf(duty_ns, sizeof(duty_ns), "%llu", (unsigned long long)ns);

  // Drop drive strength before touching direction when stopping
  if (out.duty == 0) writeValue(_duty_fd, duty_ns);

  writeValue(_in1_fd, out.forward ? "1" : "0");
  writeValue(_in2_fd, out.reverse ? "1" : "0");

  if (out.duty != 0) writeValue(_duty_fd, duty_ns);
}

bool SysfsMotorPins::exportGpio_(int gpio, int& fd) {
  const std::string num = std::to_string(gpio);
  const std::string dir = "/sys/class/gpio/gpio" + num;

  if (!writeSysfs("/sys/class/gpio/export", num.c_str(), true)) return false;
  if (!writeSysfs(dir + "/direction", "out")) return false;

  fd = ::open((dir + "/value").c_str(), O_WRONLY | O_CLOEXEC);
  if (fd < 0) {
    LOG_ERROR("Motor", "open(%s/value) failed: %s", dir.c_str(), strerror(errno));
    return false;
  }
  writeValue(fd, "0");
  return true;
}

bool SysfsMotorPins::exportPwm_() {
  const std::string chip = "/sys/class/pwm/pwmchip" + std::to_string(_pwm_chip);
  const std::string channel = std::to_string(_pwm_channel);

  if (!writeSysfs(chip + "/export", channel.c_str(), true)) return false;

  // duty must never exceed period, so zero it before setting the period
  const std::string period = std::to_string(PWM_PERIOD_NS);
  if (!writeSysfs(_pwm_dir + "/duty_cycle", "0")) return false;
  if (!writeSysfs(_pwm_dir + "/period", period.c_str())) return false;
  if (!writeSysfs(_pwm_dir + "/enable", "1")) return false;

  _duty_fd = ::open((_pwm_dir + "/duty_cycle").c_str(), O_WRONLY | O_CLOEXEC);
  if (_duty_fd < 0) {
    LOG_ERROR("Motor", "open(%s/duty_cycle) failed: %s", _pwm_dir.c_str(), strerror(errno));
    return false;
  }
  return true;
}

void SysfsMotorPins::closeAll_() {
  if (_in1_fd >= 0)  { ::close(_in1_fd);  _in1_fd = -1; }
  if (_in2_fd >= 0)  { ::close(_in2_fd);  _in2_fd = -1; }
  if (_duty_fd >= 0) { ::close(_duty_fd); _duty_fd = -1; }
}
