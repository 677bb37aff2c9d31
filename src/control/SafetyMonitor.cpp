#include "control/SafetyMonitor.h"

#include <chrono>

#include "Params.h"
#include "utils/Clock.h"
#include "utils/Log.h"

SafetyMonitor::SafetyMonitor(DriveTrain& drive, uint32_t poll_ms)
: _drive(drive),
  _poll_ms(poll_ms == 0 ? 1 : poll_ms)
{
}

SafetyMonitor::~SafetyMonitor() {
  stop();
}

bool SafetyMonitor::start() {
  if (_running.exchange(true)) return false;

  _thread = std::thread(&SafetyMonitor::run_, this);
  LOG_INFO("Safety", "Monitor running (poll=%lu ms, stale=%lu ms)",
           (unsigned long)_poll_ms, (unsigned long)SAFETY_STALE_MS);
  return true;
}

void SafetyMonitor::stop() {
  {
    std::lock_guard<std::mutex> lock(_wake_mutex);
    _running.store(false);
  }
  _wake.notify_all();

  if (_thread.joinable()) _thread.join();
}

bool SafetyMonitor::isStale(const CommandState::Snapshot& s, uint32_t now_ms) {
  return s.stale(now_ms);
}

bool SafetyMonitor::tick(uint32_t now_ms) {
  if (!_engaged.load()) {
    // Check and stop under the DriveTrain lock: a concurrent apply() lands
    // either before (not stale) or after (overrides the stop)
    CommandState::Snapshot s;
    if (!_drive.stopIfStale(now_ms, s)) return false;

    _stops++;
    _engaged.store(true);
    LOG_WARN("Safety", "EMERGENCY STOP (last command %lu ms ago)",
             (unsigned long)(now_ms - s.last_cmd_ms));
    return true;
  }

  const CommandState::Snapshot s = _drive.state().snapshot();
  if (s.stale(now_ms)) return true;

  _engaged.store(false);
  LOG_INFO("Safety", "Safety cleared (last command %lu ms ago)",
           (unsigned long)(now_ms - s.last_cmd_ms));
  return false;
}

void SafetyMonitor::run_() {
  std::unique_lock<std::mutex> lock(_wake_mutex);
  while (_running.load()) {
    lock.unlock();
    tick(millis());
    lock.lock();

    _wake.wait_for(lock, std::chrono::milliseconds(_poll_ms),
                   [this] { return !_running.load(); });
  }
}
