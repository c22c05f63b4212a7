/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      include/SysfsHardwarePort.h
 * Description:
 * IHardwarePort on the flap controller board. Locks, RFID power and RFID
 * field are sysfs GPIO outputs, the motion sensors are sysfs GPIO inputs and
 * tags arrive as text lines on the RFID reader's serial device.
 * =================================================================================
 */
#pragma once
#include <atomic>
#include <mutex>
#include <string>
#include <thread>

#include "ControlContext.h"

class SysfsHardwarePort : public IHardwarePort {
public:
  SysfsHardwarePort(IPlatformHAL &hal, const char *gpioRoot, const char *rfidDevice);
  ~SysfsHardwarePort();

  // Exports and configures all lines; both locks end up LOCKED, RFID off.
  bool initialize();

  // --- IHardwarePort Implementation ---
  bool readSnapshot(HardwareSnapshot &out) override;
  bool setLock(LockSide side, bool unlocked) override;
  bool setRfidPower(bool on) override;
  bool setRfidField(bool on) override;
  bool setRfidReading(bool reading, uint32_t readCycles) override;

private:
  IPlatformHAL &_hal;
  std::string _gpioRoot;
  std::string _rfidDevice;

  std::mutex _mutex;
  HardwareSnapshot _state; // Output lines as last written, plus last tag
  HardwareSnapshot _lastReported;
  uint32_t _version;

  // --- RFID Reader Thread ---
  std::thread _readerThread;
  std::atomic<bool> _stopReading;

  // --- GPIO Helpers ---
  bool exportLine(int gpio, const char *direction);
  bool writeLine(int gpio, bool high);
  bool readLine(int gpio, bool &high);

  void readerLoop(uint32_t readCycles);
  void stopReader();
  void logKeyValue(const char *key, const char *value);
};
