/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      include/SimulatedHardwarePort.h
 * Description:
 * In-memory flap hardware for bench use and integration tests. Accepts every
 * write and exposes injection hooks for motion, RFID tags and faults.
 * =================================================================================
 */
#pragma once
#include <mutex>

#include "ControlContext.h"

class SimulatedHardwarePort : public IHardwarePort {
public:
  explicit SimulatedHardwarePort(IPlatformHAL &hal);

  // --- IHardwarePort Implementation ---
  bool readSnapshot(HardwareSnapshot &out) override;
  bool setLock(LockSide side, bool unlocked) override;
  bool setRfidPower(bool on) override;
  bool setRfidField(bool on) override;
  bool setRfidReading(bool reading, uint32_t readCycles) override;

  // --- Injection ---
  void injectMotion(LockSide side, bool detected);
  void injectTag(const char *tagHex, uint64_t timestampMs);
  void injectFault(bool failWrites);

private:
  IPlatformHAL &_hal;
  std::mutex _mutex;
  HardwareSnapshot _state;
  HardwareSnapshot _lastReported;
  uint32_t _version;
  uint32_t _readCyclesLeft;
  bool _failWrites;

  void logKeyValue(const char *key, const char *value);
};
