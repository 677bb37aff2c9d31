#include "actuators/DcMotorActuator.h"
#include <math.h>  // fabsf

#include "Params.h"
#include "comms/Messages.h"

/*
===============================================================================
  DcMotorActuator.cpp
===============================================================================

  H-bridge truth table (IN1/IN2 direction + separate PWM enable):
    - IN1=0, IN2=0, PWM=0   -> Coast
    - IN1=1, IN2=0, PWM=d   -> Forward
    - IN1=0, IN2=1, PWM=d   -> Reverse

  duty = (MOTOR_MIN_DUTY + (1 - MOTOR_MIN_DUTY) * |target|) * PWM_DUTY_MAX
  rounded to the nearest count
===============================================================================
*/

DcMotorActuator::DcMotorActuator(MotorPins& pins, bool invert)
: _pins(pins),
  _invert(invert)
{
}

bool DcMotorActuator::begin() {
  const bool ok = _pins.begin();

  // Safe default state at startup
  immediateStop();
  return ok;
}

MotorOutputState DcMotorActuator::computeOutput(float target) {
  const float t = clampUnit(target);

  MotorOutputState out;
  if (fabsf(t) < MOTOR_DEADZONE) return out;

  out.forward = (t > 0.0f);
  out.reverse = !out.forward;

  float strength = MOTOR_MIN_DUTY + (1.0f - MOTOR_MIN_DUTY) * fabsf(t);
  if (strength > 1.0f) strength = 1.0f;

  out.duty = (uint16_t)(strength * (float)PWM_DUTY_MAX + 0.5f);
  return out;
}

void DcMotorActuator::setSpeed(float target) {
  std::lock_guard<std::mutex> lock(_mutex);

  // Optional polarity inversion for mirrored drivetrain sides
  const MotorOutputState out = computeOutput(_invert ? -target : target);

  // Only update hardware if something changed
  if (out == _prev) return;
  write_(out);
}

void DcMotorActuator::immediateStop() {
  std::lock_guard<std::mutex> lock(_mutex);
  write_(MotorOutputState());
}

void DcMotorActuator::setInverted(bool invert) {
  std::lock_guard<std::mutex> lock(_mutex);
  _invert = invert;
}

MotorOutputState DcMotorActuator::lastOutput() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _prev;
}

uint32_t DcMotorActuator::writeCount() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _writes;
}

void DcMotorActuator::write_(const MotorOutputState& out) {
  _pins.apply(out);
  _prev = out;
  _writes++;
}
