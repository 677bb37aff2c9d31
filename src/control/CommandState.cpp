#include "control/CommandState.h"

#include <math.h>  // fabsf

#include "Params.h"

void CommandState::store(const WheelTargets& wheels, uint32_t now_ms) {
  std::lock_guard<std::mutex> lock(_mutex);
  _state.wheels = wheels;
  _state.last_cmd_ms = now_ms;
}

CommandState::Snapshot CommandState::snapshot() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _state;
}

bool CommandState::Snapshot::stale(uint32_t now_ms) const {
  const uint32_t age_ms = now_ms - last_cmd_ms;
  if (age_ms <= SAFETY_STALE_MS) return false;

  return fabsf(wheels.lf) < MOTOR_DEADZONE &&
         fabsf(wheels.lr) < MOTOR_DEADZONE &&
         fabsf(wheels.rf) < MOTOR_DEADZONE &&
         fabsf(wheels.rr) < MOTOR_DEADZONE;
}
