/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      include/SystemdFallback.h
 * Description:
 * IAutonomousFallback backed by the systemd unit of the local decision service.
 * Runs 'systemctl stop|start|is-active <unit>' with a bounded wait.
 * =================================================================================
 */
#pragma once
#include <string>

#include "ControlContext.h"

class SystemdFallback : public IAutonomousFallback {
public:
  SystemdFallback(IPlatformHAL &hal, const char *serviceName, uint32_t timeoutMs = 20000);

  bool stop() override;
  bool start() override;
  bool isRunning() override;

private:
  IPlatformHAL &_hal;
  std::string _serviceName;
  uint32_t _timeoutMs;

  // Returns the exit code, 124 on timeout, -1 when the process could not start.
  int runSystemctl(const char *verb, bool quiet);
  void logKeyValue(const char *key, const char *value);
};
