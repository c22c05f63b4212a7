/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      include/LinuxControlHAL.h
 * Description: Header for the Linux implementation of IControlHAL.
 * Encapsulates clock, randomness, logging, the info-page signal file and the
 * boot marker. Used by both executables; the remote leaves the paths empty.
 * =================================================================================
 */
#pragma once

#include <chrono>
#include <mutex>
#include <random>
#include <string>

#include "ControlContext.h"
#include "Types.h"

class LinuxControlHAL : public IControlHAL {
private:
  LinuxControlHAL();

  // --- Clock ---
  std::chrono::steady_clock::time_point _startTime;

  // --- Random ---
  std::mutex _rngMutex;
  std::mt19937 _rng;

  // --- Persisted Signals ---
  std::mutex _fileMutex;
  std::string _infoSignalPath;
  std::string _bootMarkerPath;
  bool _noticeActive;

public:
  static LinuxControlHAL &getInstance();

  void configurePaths(const char *infoSignalPath, const char *bootMarkerPath);

  // --- Logging API ---
  void log(const char *message) override;
  void logKeyValue(const char *key, const char *value);
  void printStartupDiagnostics(const char *role);

  // --- IPlatformHAL Implementation ---
  unsigned long getMillis() override;
  void sleepMs(uint32_t ms) override;
  uint32_t getRandom(uint32_t min, uint32_t max) override;

  uint64_t getWallClockMs();

  // --- IControlHAL Implementation ---
  void setRemoteNotice(bool active, const char *ownerEndpoint) override;
  void markRemoteControlUsed() override;

  bool isBootMarkerPresent();
  bool isNoticeActive() const { return _noticeActive; }
};
