#pragma once
#include <cstdint>
#include <string>

#include "actuators/MotorPins.h"

/*
===============================================================================
  SysfsMotorPins.h
===============================================================================

  PURPOSE
  -------
  MotorPins backed by the Linux sysfs interfaces:

    /sys/class/gpio/gpioN/value             IN1, IN2
    /sys/class/pwm/pwmchipC/pwmK/duty_cycle PWM (period set once in begin())

  The value files are kept open so apply() is three pwrite() calls.
===============================================================================
*/

class SysfsMotorPins : public MotorPins {
public:
  SysfsMotorPins(int gpio_in1, int gpio_in2, int pwm_chip, int pwm_channel);
  ~SysfsMotorPins() override;

  SysfsMotorPins(const SysfsMotorPins&) = delete;
  SysfsMotorPins& operator=(const SysfsMotorPins&) = delete;

  bool begin() override;
  void apply(const MotorOutputState& out) override;

private:
  bool exportGpio_(int gpio, int& fd);
  bool exportPwm_();
  void closeAll_();

  int _gpio_in1;
  int _gpio_in2;
  int _pwm_chip;
  int _pwm_channel;

  std::string _pwm_dir;

  int _in1_fd = -1;
  int _in2_fd = -1;
  int _duty_fd = -1;
};
