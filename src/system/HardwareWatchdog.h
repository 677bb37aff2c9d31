#pragma once

/*
  HardwareWatchdog.h

  Purpose:
  Last-resort fault containment. The server loop calls feed() every
  iteration; if it stalls for longer than the device timeout the board is
  reset by hardware, no matter what state the software is in.

  Implementations:
  - LinuxWatchdog: /dev/watchdog (WDIOC_SETTIMEOUT / WDIOC_KEEPALIVE)
  - NullWatchdog : bench builds with ENABLE_WATCHDOG = false
*/

class HardwareWatchdog {
public:
  virtual ~HardwareWatchdog() = default;

  // Arm the watchdog. False if the device could not be opened.
  virtual bool begin() = 0;

  virtual void feed() = 0;
};

class LinuxWatchdog : public HardwareWatchdog {
public:
  LinuxWatchdog(const char* device, int timeout_s);

  // Closes the device WITHOUT the magic disarm character: if the process
  // goes away, the board still resets.
  ~LinuxWatchdog() override;

  LinuxWatchdog(const LinuxWatchdog&) = delete;
  LinuxWatchdog& operator=(const LinuxWatchdog&) = delete;

  bool begin() override;
  void feed() override;

private:
  const char* _device;
  int _timeout_s;
  int _fd = -1;
  bool _feed_failed = false;
};

class NullWatchdog : public HardwareWatchdog {
public:
  bool begin() override { return true; }
  void feed() override {}
};
