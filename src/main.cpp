/*
  Quadbot Onboard Controller

  Purpose:
  Drive four wheels from operator console commands received over TCP, and
  stop them on its own when commands go stale.

  Threads:
  - main   : supervisor + CommandServer loop (feeds the hardware watchdog)
  - safety : SafetyMonitor, polls CommandState every SAFETY_POLL_MS

  Recovery:
  - client faults are handled inside CommandServer
  - listening socket faults -> re-establish the uplink, listen again
  - "restart" directive     -> listen again
  - "shutdown" directive    -> stop motors, reset device
  - main loop stall         -> hardware watchdog resets the board
*/

#include <memory>

#include "Params.h"
#include "Pins.h"

#include "actuators/DcMotorActuator.h"
#include "actuators/SysfsMotorPins.h"
#include "comms/CommandServer.h"
#include "control/CommandState.h"
#include "control/DriveTrain.h"
#include "control/SafetyMonitor.h"
#include "system/DeviceControl.h"
#include "system/HardwareWatchdog.h"
#include "system/NetworkLink.h"
#include "utils/Clock.h"
#include "utils/Log.h"


/*=============================================================================
  HELPERS
=============================================================================*/

// Last resort when a software reset is refused: stop feeding and let the
// hardware watchdog take the board down.
[[noreturn]] static void haltForWatchdog(DriveTrain& drive) {
  LOG_ERROR("Main", "Halting; waiting for hardware watchdog reset");
  for (;;) {
    drive.stopAll();
    delayMs(1000);
  }
}

static void resetDevice(DeviceControl& device, DriveTrain& drive) {
  drive.stopAll();
  if (!device.reset()) haltForWatchdog(drive);
}

static void bringLinkUp(NetworkLink& link, HardwareWatchdog& watchdog,
                        DeviceControl& device, DriveTrain& drive) {
  if (link.connect(watchdog)) return;

  LOG_ERROR("Main", "Network link failed, rebooting");
  resetDevice(device, drive);
}


/*=============================================================================
  MAIN
=============================================================================*/

int main() {
  LOG_INFO("Main", "Quadbot controller starting");

  // Motor outputs
  SysfsMotorPins lf_pins(PIN_LF_IN1, PIN_LF_IN2, PWM_LF_CHIP, PWM_LF_CHANNEL);
  SysfsMotorPins lr_pins(PIN_LR_IN1, PIN_LR_IN2, PWM_LR_CHIP, PWM_LR_CHANNEL);
  SysfsMotorPins rf_pins(PIN_RF_IN1, PIN_RF_IN2, PWM_RF_CHIP, PWM_RF_CHANNEL);
  SysfsMotorPins rr_pins(PIN_RR_IN1, PIN_RR_IN2, PWM_RR_CHIP, PWM_RR_CHANNEL);

  DcMotorActuator lf_motor(lf_pins, MOTOR_LF_INVERT);
  DcMotorActuator lr_motor(lr_pins, MOTOR_LR_INVERT);
  DcMotorActuator rf_motor(rf_pins, MOTOR_RF_INVERT);
  DcMotorActuator rr_motor(rr_pins, MOTOR_RR_INVERT);

  CommandState state;
  DriveTrain drive(lf_motor, lr_motor, rf_motor, rr_motor, state);

  if (!drive.begin()) {
    LOG_ERROR("Main", "Motor output setup incomplete; affected motors will not move");
  }

  // Watchdog
  std::unique_ptr<HardwareWatchdog> watchdog;
  if (ENABLE_WATCHDOG) {
    watchdog = std::make_unique<LinuxWatchdog>(WATCHDOG_DEVICE, WATCHDOG_TIMEOUT_S);
  } else {
    watchdog = std::make_unique<NullWatchdog>();
  }
  if (!watchdog->begin()) {
    LOG_ERROR("Main", "Hardware watchdog unavailable; running without it");
  }

  LinuxNetworkLink link(NETWORK_INTERFACE);
  LinuxDeviceControl device;

  bringLinkUp(link, *watchdog, device, drive);

  // Safety monitor runs on its own thread from here on
  SafetyMonitor safety(drive);
  safety.start();

  CommandServer server(SERVER_PORT, drive, *watchdog);

  for (;;) {
    if (!server.begin()) {
      LOG_ERROR("Main", "Server start failed, re-establishing link");
      bringLinkUp(link, *watchdog, device, drive);
      watchdog->feed();
      delayMs(LINK_RETRY_DELAY_MS);
      continue;
    }

    const ServeResult result = server.serve();
    LOG_WARN("Main", "Server stopped: %s", serveResultName(result));
    server.end();

    switch (result) {
      case ServeResult::RESTART:
        break;

      case ServeResult::LISTEN_FAULT:
        bringLinkUp(link, *watchdog, device, drive);
        break;

      case ServeResult::SHUTDOWN:
        resetDevice(device, drive);
        break;

      case ServeResult::CONTINUE:
        break;
    }
  }
}
