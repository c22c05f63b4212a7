/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      src/LinuxControlHAL.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Platform services on the Linux SBC. The info-page signal is a small JSON
 * file the port-80 web service polls; the boot marker records that remote
 * control has been requested on this device.
 * =================================================================================
 */
#include <ArduinoJson.h>
#include <stdio.h>
#include <sys/utsname.h>
#include <thread>
#include <unistd.h>

#include "Config.h"
#include "LinuxControlHAL.h"
#include "Logger.h"
#include "Storage.h"

// =================================================================================
// SECTION: CLASS IMPLEMENTATION
// =================================================================================

LinuxControlHAL::LinuxControlHAL() : _startTime(std::chrono::steady_clock::now()), _noticeActive(false) {
  std::random_device rd;
  _rng.seed(rd());
}

LinuxControlHAL &LinuxControlHAL::getInstance() {
  static LinuxControlHAL instance;
  return instance;
}

void LinuxControlHAL::configurePaths(const char *infoSignalPath, const char *bootMarkerPath) {
  std::lock_guard<std::mutex> lock(_fileMutex);
  _infoSignalPath = infoSignalPath ? infoSignalPath : "";
  _bootMarkerPath = bootMarkerPath ? bootMarkerPath : "";
}

// --- Logging ---

void LinuxControlHAL::log(const char *message) { logMessage(message); }

void LinuxControlHAL::logKeyValue(const char *key, const char *value) {
  char tempBuf[MAX_LOG_LENGTH];
  snprintf(tempBuf, MAX_LOG_LENGTH, " %-8s : %s", key, value);
  log(tempBuf);
}

void LinuxControlHAL::printStartupDiagnostics(const char *role) {
  char logBuf[128];

  log(LOG_SEP_MAJOR);
  log("                            DEVICE DIAGNOSTICS                           ");
  log(LOG_SEP_MAJOR);

  log("[ SYSTEM ]");

  struct utsname uts;
  if (uname(&uts) == 0) {
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s %s (%s)", "Kernel", uts.sysname, uts.release, uts.machine);
    log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Hostname", uts.nodename);
    log(logBuf);
  }

  snprintf(logBuf, sizeof(logBuf), " %-25s : %d", "PID", (int)getpid());
  log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Role", role);
  log(logBuf);

  if (!_infoSignalPath.empty()) {
    log("");
    log("[ SIGNAL FILES ]");
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Info Signal", _infoSignalPath.c_str());
    log(logBuf);
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s (%s)", "Boot Marker", _bootMarkerPath.c_str(),
             isBootMarkerPresent() ? "PRESENT" : "absent");
    log(logBuf);
  }
}

// --- Clock & Random ---

unsigned long LinuxControlHAL::getMillis() {
  return (unsigned long)std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                              _startTime)
      .count();
}

void LinuxControlHAL::sleepMs(uint32_t ms) { std::this_thread::sleep_for(std::chrono::milliseconds(ms)); }

uint32_t LinuxControlHAL::getRandom(uint32_t min, uint32_t max) {
  if (max <= min) return min;
  std::lock_guard<std::mutex> lock(_rngMutex);
  std::uniform_int_distribution<uint32_t> dist(min, max);
  return dist(_rng);
}

uint64_t LinuxControlHAL::getWallClockMs() {
  return (uint64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

// =================================================================================
// SECTION: INFO PAGE SIGNAL
// =================================================================================

/**
 * Raises or clears the "controlled remotely" signal. The port-80 collaborator
 * shows the notice page while the file exists.
 */
void LinuxControlHAL::setRemoteNotice(bool active, const char *ownerEndpoint) {
  std::lock_guard<std::mutex> lock(_fileMutex);
  _noticeActive = active;
  if (_infoSignalPath.empty()) return;

  std::string err;
  if (!active) {
    if (!removeFile(_infoSignalPath)) {
      logKeyValue("System", ("Info signal removal failed: " + _infoSignalPath).c_str());
    } else {
      logKeyValue("System", "Info page signal cleared.");
    }
    return;
  }

  JsonDocument doc;
  doc["active"] = true;
  doc["owner"] = ownerEndpoint ? ownerEndpoint : "";
  doc["since_ms"] = getWallClockMs();
  std::string out;
  serializeJson(doc, out);

  if (!writeFileAtomic(_infoSignalPath, out, err)) {
    logKeyValue("System", ("Info signal write failed: " + err).c_str());
    return;
  }

  char logBuf[96];
  snprintf(logBuf, sizeof(logBuf), "Info page signal raised (%s).", ownerEndpoint ? ownerEndpoint : "");
  logKeyValue("System", logBuf);
}

// =================================================================================
// SECTION: BOOT MARKER
// =================================================================================

void LinuxControlHAL::markRemoteControlUsed() {
  std::lock_guard<std::mutex> lock(_fileMutex);
  if (_bootMarkerPath.empty()) return;

  JsonDocument doc;
  doc["remote_control_used"] = true;
  doc["last_claim_ms"] = getWallClockMs();
  std::string out;
  serializeJson(doc, out);

  std::string err;
  if (!writeFileAtomic(_bootMarkerPath, out, err)) {
    logKeyValue("System", ("Boot marker write failed: " + err).c_str());
  }
}

bool LinuxControlHAL::isBootMarkerPresent() {
  std::string path;
  {
    std::lock_guard<std::mutex> lock(_fileMutex);
    path = _bootMarkerPath;
  }
  if (path.empty()) return false;

  std::string text, err;
  if (!readFileToString(path, text, err)) return false;

  JsonDocument doc;
  if (deserializeJson(doc, text)) return false;
  return doc["remote_control_used"] | false;
}
