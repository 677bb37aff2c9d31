#pragma once

/*
  DeviceControl.h

  Purpose:
  Full device reset, used by the "shutdown" directive and when the uplink
  cannot be brought back.
*/

class DeviceControl {
public:
  virtual ~DeviceControl() = default;

  // Does not return on success. False if the reset was refused.
  virtual bool reset() = 0;
};

class LinuxDeviceControl : public DeviceControl {
public:
  bool reset() override;
};
