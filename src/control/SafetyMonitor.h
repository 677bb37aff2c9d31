#pragma once
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <thread>

#include "Params.h"
#include "control/CommandState.h"
#include "control/DriveTrain.h"

/*
===============================================================================
  SafetyMonitor.h
===============================================================================

  PURPOSE
  -------
  Emergency stop that does not depend on the server loop being healthy.

  Stale condition (evaluated every SAFETY_POLL_MS on its own thread):
    - last command older than SAFETY_STALE_MS, AND
    - every stored wheel value has |v| < MOTOR_DEADZONE

  Edge triggered:
    - rising edge  -> DriveTrain::stopIfStale() stops once, engaged = true
    - falling edge -> engaged = false
  Nothing is written while the condition simply persists.

  USAGE
  -----
  - start() once after the motors are initialized
  - tick(now_ms) can be called directly (tests) instead of start()
===============================================================================
*/

class SafetyMonitor {
public:
  explicit SafetyMonitor(DriveTrain& drive, uint32_t poll_ms = SAFETY_POLL_MS);

  // Stops and joins the polling thread if it was started.
  ~SafetyMonitor();

  SafetyMonitor(const SafetyMonitor&) = delete;
  SafetyMonitor& operator=(const SafetyMonitor&) = delete;

  // Spawn the polling thread. False if already running.
  bool start();
  void stop();

  // One evaluation. Returns the engaged flag after the update.
  bool tick(uint32_t now_ms);

  bool engaged() const { return _engaged.load(); }

  // Number of rising edges (emergency stops issued) since construction
  uint32_t emergencyStops() const { return _stops.load(); }

  // Pure condition, exposed for tests
  static bool isStale(const CommandState::Snapshot& s, uint32_t now_ms);

private:
  void run_();

  DriveTrain& _drive;
  uint32_t _poll_ms;

  std::atomic<bool> _engaged{false};
  std::atomic<uint32_t> _stops{0};

  std::atomic<bool> _running{false};
  std::thread _thread;

  std::mutex _wake_mutex;
  std::condition_variable _wake;
};
