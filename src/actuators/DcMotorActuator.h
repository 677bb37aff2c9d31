#pragma once
#include <cstdint>
#include <mutex>

#include "actuators/MotorPins.h"

/*
===============================================================================
  DcMotorActuator.h
===============================================================================

  PURPOSE
  -------
  Maps a normalized speed target to IN1/IN2/PWM for one brushed DC motor.

  Responsibilities:
    - Deadzone: |target| < MOTOR_DEADZONE -> coast (0, 0, 0)
    - Minimum duty: any nonzero target gets at least MOTOR_MIN_DUTY so the
      gearmotor actually breaks away, scaling linearly to full at |target|=1
    - Write suppression: hardware is touched only when the output changes
    - immediateStop(): unconditional coast for the safety monitor

  Notes:
    - Called from the server loop (setSpeed) and the safety monitor thread
      (immediateStop); both paths take the same lock.
    - This class does NOT do closed-loop control.
===============================================================================
*/

class DcMotorActuator {
public:
  /*
    pins:
      Outputs for this H-bridge channel (not owned)

    invert:
      If true, flips sign of commanded target
      (useful when motor wiring polarity differs side-to-side)
  */
  explicit DcMotorActuator(MotorPins& pins, bool invert = false);

  // Configure outputs and force safe stopped state.
  bool begin();

  /*
    Set normalized speed target.

    target:
      -1.0 = full reverse
       0.0 = stop (coast)
      +1.0 = full forward
  */
  void setSpeed(float target);

  // Force (0, 0, 0) regardless of what was last written.
  void immediateStop();

  // Optional runtime polarity update.
  void setInverted(bool invert);

  // Pure mapping target -> output tuple (clamps, applies deadzone/min duty).
  static MotorOutputState computeOutput(float target);

  // Debug/introspection
  MotorOutputState lastOutput() const;
  uint32_t writeCount() const;

private:
  void write_(const MotorOutputState& out);

  MotorPins& _pins;
  bool _invert;

  mutable std::mutex _mutex;

  // Last tuple written to the pins
  MotorOutputState _prev;
  uint32_t _writes = 0;
};
