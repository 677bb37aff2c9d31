#include "control/DriveTrain.h"

DriveTrain::DriveTrain(DcMotorActuator& lf,
                       DcMotorActuator& lr,
                       DcMotorActuator& rf,
                       DcMotorActuator& rr,
                       CommandState& state)
: _lf(lf),
  _lr(lr),
  _rf(rf),
  _rr(rr),
  _state(state)
{
}

bool DriveTrain::begin() {
  bool ok = true;
  ok = _lf.begin() && ok;
  ok = _lr.begin() && ok;
  ok = _rf.begin() && ok;
  ok = _rr.begin() && ok;
  return ok;
}

void DriveTrain::apply(const WheelTargets& targets, uint32_t now_ms) {
  const WheelTargets t = clampTargets(targets);

  std::lock_guard<std::mutex> lock(_mutex);

  _state.store(t, now_ms);

  _lf.setSpeed(t.lf);
  _lr.setSpeed(t.lr);
  _rf.setSpeed(t.rf);
  _rr.setSpeed(t.rr);
}

void DriveTrain::stopAll() {
  std::lock_guard<std::mutex> lock(_mutex);
  stopAll_();
}

bool DriveTrain::stopIfStale(uint32_t now_ms, CommandState::Snapshot& seen) {
  std::lock_guard<std::mutex> lock(_mutex);

  seen = _state.snapshot();
  if (!seen.stale(now_ms)) return false;

  stopAll_();
  return true;
}

void DriveTrain::stopAll_() {
  _lf.immediateStop();
  _lr.immediateStop();
  _rf.immediateStop();
  _rr.immediateStop();
}
