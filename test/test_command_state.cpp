#include <gtest/gtest.h>

#include <atomic>
#include <thread>

#include "Params.h"
#include "control/CommandState.h"
#include "support/TestRig.h"

namespace {

TEST(CommandStateTest, StartsZeroedAtEpoch) {
  CommandState state;
  const CommandState::Snapshot s = state.snapshot();
  EXPECT_EQ(s.wheels.lf, 0.0f);
  EXPECT_EQ(s.wheels.lr, 0.0f);
  EXPECT_EQ(s.wheels.rf, 0.0f);
  EXPECT_EQ(s.wheels.rr, 0.0f);
  EXPECT_EQ(s.last_cmd_ms, 0u);
}

TEST(CommandStateTest, StoreReplacesWholeRecord) {
  CommandState state;
  WheelTargets w;
  w.lf = 0.1f;
  w.lr = 0.2f;
  w.rf = 0.3f;
  w.rr = 0.4f;
  state.store(w, 1234);

  const CommandState::Snapshot s = state.snapshot();
  EXPECT_FLOAT_EQ(s.wheels.lf, 0.1f);
  EXPECT_FLOAT_EQ(s.wheels.lr, 0.2f);
  EXPECT_FLOAT_EQ(s.wheels.rf, 0.3f);
  EXPECT_FLOAT_EQ(s.wheels.rr, 0.4f);
  EXPECT_EQ(s.last_cmd_ms, 1234u);
}

TEST(CommandStateTest, ReaderNeverSeesTornWrite) {
  CommandState state;
  std::atomic<bool> done{false};

  std::thread writer([&] {
    for (uint32_t i = 1; i <= 20000; i++) {
      const float v = (i % 2) ? 0.75f : -0.25f;
      WheelTargets w;
      w.lf = w.lr = w.rf = w.rr = v;
      state.store(w, i);
    }
    done = true;
  });

  int torn = 0;
  while (!done) {
    const CommandState::Snapshot s = state.snapshot();
    if (s.wheels.lf != s.wheels.lr || s.wheels.lf != s.wheels.rf || s.wheels.lf != s.wheels.rr) torn++;
    if (s.last_cmd_ms != 0) {
      const float expected = (s.last_cmd_ms % 2) ? 0.75f : -0.25f;
      if (s.wheels.lf != expected) torn++;
    }
  }
  writer.join();

  EXPECT_EQ(torn, 0);
}

TEST(DriveTrainTest, BeginStopsEveryMotor) {
  TestRig rig;
  EXPECT_TRUE(rig.drive.begin());
  for (FakeMotorPins* p : rig.pins) {
    EXPECT_TRUE(p->begun());
    EXPECT_EQ(p->writeCount(), 1u);
    EXPECT_TRUE(p->last().isZero());
  }
}

TEST(DriveTrainTest, BeginReportsAnyFailedMotor) {
  TestRig rig;
  rig.rf_pins.failBegin();
  EXPECT_FALSE(rig.drive.begin());

  // The others were still initialized
  EXPECT_TRUE(rig.rr_pins.begun());
  EXPECT_TRUE(rig.lf_pins.last().isZero());
}

TEST(DriveTrainTest, ApplyClampsStoresAndDrives) {
  TestRig rig;
  rig.drive.begin();

  WheelTargets t;
  t.lf = 0.5f;
  t.lr = -0.5f;
  t.rf = 2.0f;
  t.rr = 0.01f;
  rig.drive.apply(t, 500);

  const CommandState::Snapshot s = rig.state.snapshot();
  EXPECT_FLOAT_EQ(s.wheels.lf, 0.5f);
  EXPECT_FLOAT_EQ(s.wheels.lr, -0.5f);
  EXPECT_EQ(s.wheels.rf, 1.0f);
  EXPECT_FLOAT_EQ(s.wheels.rr, 0.01f);
  EXPECT_EQ(s.last_cmd_ms, 500u);

  EXPECT_TRUE(rig.lf_pins.last().forward);
  EXPECT_TRUE(rig.lr_pins.last().reverse);
  EXPECT_EQ(rig.rf_pins.last().duty, PWM_DUTY_MAX);

  // Inside the deadzone: still zero, so nothing new was written
  EXPECT_EQ(rig.rr_pins.writeCount(), 1u);
}

TEST(DriveTrainTest, StopAllForcesZeroOnEveryMotor) {
  TestRig rig;
  rig.drive.begin();

  WheelTargets t;
  t.lf = t.lr = t.rf = t.rr = 0.9f;
  rig.drive.apply(t, 10);
  rig.drive.stopAll();

  for (FakeMotorPins* p : rig.pins) {
    EXPECT_EQ(p->writeCount(), 3u);
    EXPECT_TRUE(p->last().isZero());
  }

  // Stop does not rewrite the command record
  EXPECT_FLOAT_EQ(rig.state.snapshot().wheels.lf, 0.9f);
}

TEST(DriveTrainTest, StopIfStaleOnlyStopsStaleRecord) {
  TestRig rig;
  rig.drive.begin();

  WheelTargets zero;
  rig.drive.apply(zero, 1000);

  CommandState::Snapshot seen;
  EXPECT_FALSE(rig.drive.stopIfStale(1000 + SAFETY_STALE_MS, seen));
  EXPECT_EQ(seen.last_cmd_ms, 1000u);
  EXPECT_EQ(rig.lf_pins.writeCount(), 1u);

  EXPECT_TRUE(rig.drive.stopIfStale(1000 + SAFETY_STALE_MS + 1, seen));
  for (FakeMotorPins* p : rig.pins) {
    EXPECT_EQ(p->writeCount(), 2u);
    EXPECT_TRUE(p->last().isZero());
  }

  // Moving robot: never stale, however old
  WheelTargets moving;
  moving.lf = moving.lr = moving.rf = moving.rr = 0.6f;
  rig.drive.apply(moving, 5000);
  EXPECT_FALSE(rig.drive.stopIfStale(5000 + 60000, seen));
  EXPECT_TRUE(rig.lf_pins.last().forward);
}

}  // namespace
