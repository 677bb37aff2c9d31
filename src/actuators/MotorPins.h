#pragma once
#include <cstdint>

/*
===============================================================================
  MotorPins.h
===============================================================================

  PURPOSE
  -------
  Capability interface for the outputs of one H-bridge channel:

    - IN1 (forward), IN2 (reverse)
    - PWM duty in 0..PWM_DUTY_MAX

  DcMotorActuator decides WHAT to write; implementations only know HOW.
  Tests substitute a recording implementation.
===============================================================================
*/

struct MotorOutputState {
  bool forward = false;
  bool reverse = false;
  uint16_t duty = 0;

  bool isZero() const { return !forward && !reverse && duty == 0; }

  bool operator==(const MotorOutputState& o) const {
    return forward == o.forward && reverse == o.reverse && duty == o.duty;
  }
  bool operator!=(const MotorOutputState& o) const { return !(*this == o); }
};

class MotorPins {
public:
  virtual ~MotorPins() = default;

  // Claim and configure the outputs. Returns false if the hardware is
  // unavailable.
  virtual bool begin() = 0;

  // Drive the outputs. Never blocks for long; failures are logged by the
  // implementation.
  virtual void apply(const MotorOutputState& out) = 0;
};
