#pragma once
#include <cstdint>
#include <mutex>

#include "comms/Messages.h"

/*
  CommandState

  Purpose:
  - Last applied wheel targets + time they were accepted
  - Written by the server loop, read by the safety monitor

  The whole record is written and read under one lock, so a reader never
  sees a mix of old and new wheel values.

  Starts as all-zero with last_cmd_ms = 0 (process start).
*/

class CommandState {
public:
  struct Snapshot {
    WheelTargets wheels;
    uint32_t last_cmd_ms = 0;

    // Older than SAFETY_STALE_MS and every wheel inside MOTOR_DEADZONE
    bool stale(uint32_t now_ms) const;
  };

  void store(const WheelTargets& wheels, uint32_t now_ms);

  Snapshot snapshot() const;

private:
  mutable std::mutex _mutex;
  Snapshot _state;
};
