/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      src/SimulatedHardwarePort.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <stdio.h>
#include <string.h>

#include "LogicUtils.h"
#include "SimulatedHardwarePort.h"

SimulatedHardwarePort::SimulatedHardwarePort(IPlatformHAL &hal)
    : _hal(hal), _version(1), _readCyclesLeft(0), _failWrites(false) {
  memset(&_state, 0, sizeof(_state));
  memset(&_lastReported, 0, sizeof(_lastReported));
}

void SimulatedHardwarePort::logKeyValue(const char *key, const char *value) {
  char tempBuf[MAX_LOG_LENGTH];
  snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
  _hal.log(tempBuf);
}

bool SimulatedHardwarePort::readSnapshot(HardwareSnapshot &out) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (LogicUtils::diffSnapshots(_state, _lastReported) != 0) {
    _version++;
    _lastReported = _state;
  }
  out = _state;
  out.version = _version;
  return true;
}

bool SimulatedHardwarePort::setLock(LockSide side, bool unlocked) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (_failWrites) return false;
  if (side == SIDE_INNER) _state.innerUnlocked = unlocked;
  else _state.outerUnlocked = unlocked;

  char logBuf[64];
  snprintf(logBuf, sizeof(logBuf), "Simulation: %s lock %s", side == SIDE_INNER ? "inner" : "outer",
           unlocked ? "UNLOCKED" : "LOCKED");
  logKeyValue("Hardware", logBuf);
  return true;
}

bool SimulatedHardwarePort::setRfidPower(bool on) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (_failWrites) return false;
  _state.rfidPowered = on;
  return true;
}

bool SimulatedHardwarePort::setRfidField(bool on) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (_failWrites) return false;
  _state.rfidField = on;
  return true;
}

bool SimulatedHardwarePort::setRfidReading(bool reading, uint32_t readCycles) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (_failWrites) return false;
  // A read operation drives the field for its duration
  _state.rfidReading = reading;
  _state.rfidField = reading;
  _readCyclesLeft = reading ? readCycles : 0;
  return true;
}

void SimulatedHardwarePort::injectMotion(LockSide side, bool detected) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (side == SIDE_INNER) _state.innerMotion = detected;
  else _state.outerMotion = detected;
}

void SimulatedHardwarePort::injectTag(const char *tagHex, uint64_t timestampMs) {
  std::lock_guard<std::mutex> lock(_mutex);
  if (!_state.rfidReading) return;

  LogicUtils::copyString(_state.rfidTag, sizeof(_state.rfidTag), tagHex);
  _state.rfidTimestampMs = timestampMs;

  if (_readCyclesLeft > 0 && --_readCyclesLeft == 0) {
    _state.rfidReading = false;
    _state.rfidField = false;
  }
}

void SimulatedHardwarePort::injectFault(bool failWrites) {
  std::lock_guard<std::mutex> lock(_mutex);
  _failWrites = failWrites;
}
