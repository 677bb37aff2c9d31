#pragma once
#include <cstdint>
#include <mutex>

#include "actuators/DcMotorActuator.h"
#include "comms/Messages.h"
#include "control/CommandState.h"

/*
===============================================================================
  DriveTrain.h
===============================================================================

  PURPOSE
  -------
  Four independently driven wheels plus the shared command record.

    - apply(): clamp, record in CommandState, set all four motors
    - stopAll(): immediateStop() on every motor
    - stopIfStale(): stale check + stopAll() as one step (safety path)

  apply() and stopIfStale() hold the same lock, so a command that lands
  while the safety monitor is deciding is never zeroed after the fact.

  Motors and state are owned by the caller; DriveTrain only holds references.
===============================================================================
*/

class DriveTrain {
public:
  DriveTrain(DcMotorActuator& lf,
             DcMotorActuator& lr,
             DcMotorActuator& rf,
             DcMotorActuator& rr,
             CommandState& state);

  // Configure every motor output and leave them stopped. False if any
  // motor failed to initialize (the others are still usable).
  bool begin();

  void apply(const WheelTargets& targets, uint32_t now_ms);

  void stopAll();

  // Stop every motor if the stored command is stale at now_ms. `seen` gets
  // the record the decision was made on. True if the motors were stopped.
  bool stopIfStale(uint32_t now_ms, CommandState::Snapshot& seen);

  const CommandState& state() const { return _state; }

private:
  void stopAll_();

  std::mutex _mutex;

  DcMotorActuator& _lf;
  DcMotorActuator& _lr;
  DcMotorActuator& _rf;
  DcMotorActuator& _rr;

  CommandState& _state;
};
