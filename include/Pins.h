#pragma once
#include <cstdint>

/*
  Pins.h

  Purpose:
  Central location for all GPIO / PWM assignments of the four-wheel base.
  Keeps hardware mapping explicit, readable, and easy to modify.

  Notes:
  - Each H-bridge channel uses IN1 / IN2 for direction and one PWM line
    for drive strength (sysfs GPIO numbering, sysfs pwmchip/channel)
  - IN1 high = forward, IN2 high = reverse, both low = coast
  - MOTOR_*_INVERT flips polarity for motors wired backwards
*/

/* ============================================================================
   LEFT FRONT
============================================================================ */

constexpr int PIN_LF_IN1 = 16;
constexpr int PIN_LF_IN2 = 17;
constexpr int PWM_LF_CHIP = 0;
constexpr int PWM_LF_CHANNEL = 0;
constexpr bool MOTOR_LF_INVERT = false;

/* ============================================================================
   LEFT REAR
============================================================================ */

constexpr int PIN_LR_IN1 = 19;
constexpr int PIN_LR_IN2 = 20;
constexpr int PWM_LR_CHIP = 0;
constexpr int PWM_LR_CHANNEL = 1;
constexpr bool MOTOR_LR_INVERT = false;

/* ============================================================================
   RIGHT FRONT
============================================================================ */

constexpr int PIN_RF_IN1 = 13;
constexpr int PIN_RF_IN2 = 14;
constexpr int PWM_RF_CHIP = 1;
constexpr int PWM_RF_CHANNEL = 0;
constexpr bool MOTOR_RF_INVERT = false;

/* ============================================================================
   RIGHT REAR
============================================================================ */

constexpr int PIN_RR_IN1 = 10;
constexpr int PIN_RR_IN2 = 11;
constexpr int PWM_RR_CHIP = 1;
constexpr int PWM_RR_CHANNEL = 1;
constexpr bool MOTOR_RR_INVERT = false;

/* ============================================================================
   SYSTEM DEVICES
============================================================================ */

constexpr const char* WATCHDOG_DEVICE = "/dev/watchdog";

// Uplink the operator console reaches us on
constexpr const char* NETWORK_INTERFACE = "wlan0";
