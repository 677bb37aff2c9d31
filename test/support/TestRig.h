#pragma once

#include "actuators/DcMotorActuator.h"
#include "control/CommandState.h"
#include "control/DriveTrain.h"
#include "support/FakeMotorPins.h"

// Four fake-backed motors wired into a DriveTrain, as main() wires the real ones.
struct TestRig {
  FakeMotorPins lf_pins, lr_pins, rf_pins, rr_pins;

  DcMotorActuator lf{lf_pins};
  DcMotorActuator lr{lr_pins};
  DcMotorActuator rf{rf_pins};
  DcMotorActuator rr{rr_pins};

  CommandState state;
  DriveTrain drive{lf, lr, rf, rr, state};

  FakeMotorPins* pins[4] = {&lf_pins, &lr_pins, &rf_pins, &rr_pins};
};
