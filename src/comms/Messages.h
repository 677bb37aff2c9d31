#pragma once
#include <cmath>
#include <cstdint>

/*
===============================================================================
  Messages.h
===============================================================================

  PURPOSE
  -------
  Defines command and acknowledgement data exchanged between the operator
  console and the robot over length-prefixed MessagePack frames.

  Command payload (console -> robot):
    {"lf": <num>, "lr": <num>, "rf": <num>, "rr": <num>, "cmd_id": <int>}
    {"command": "restart" | "shutdown", "cmd_id": <int>}

  Acknowledgement payload (robot -> console):
    {"cmd_id": <int>}

  Notes:
  - Missing wheel keys read as 0.
  - "command" wins over motion fields in the same payload.
===============================================================================
*/


/*=============================================================================
  WHEEL TARGETS
=============================================================================*/

// Normalized wheel targets in [-1.0, +1.0]
struct WheelTargets {
  float lf = 0.0f;   // left front
  float lr = 0.0f;   // left rear
  float rf = 0.0f;   // right front
  float rr = 0.0f;   // right rear
};

// Clamp to [-1, 1]; NaN reads as 0
inline float clampUnit(float v) {
  if (std::isnan(v)) return 0.0f;
  if (v > 1.0f) return 1.0f;
  if (v < -1.0f) return -1.0f;
  return v;
}

inline WheelTargets clampTargets(const WheelTargets& w) {
  WheelTargets out;
  out.lf = clampUnit(w.lf);
  out.lr = clampUnit(w.lr);
  out.rf = clampUnit(w.rf);
  out.rr = clampUnit(w.rr);
  return out;
}


/*=============================================================================
  COMMAND STRUCTURES (Console -> Robot)
=============================================================================*/

// Out-of-band directives (match console string values)
enum class Directive : uint8_t {
  NONE = 0,
  RESTART,    // "restart": drop client, re-enter listening
  SHUTDOWN,   // "shutdown": full device reset
  UNKNOWN,    // "command" key present with an unsupported value
};

struct CommandFrame {
  WheelTargets wheels;

  int64_t cmd_id = 0;
  bool has_cmd_id = false;   // ack only when the console asked for one

  Directive directive = Directive::NONE;

  bool valid = false;  // set true after successful decode
};
