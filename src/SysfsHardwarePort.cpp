/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      src/SysfsHardwarePort.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * sysfs GPIO + serial RFID driver. A lock line HIGH means the magnet releases
 * that direction (unlocked). The inner motion sensor is active low.
 * =================================================================================
 */
#include <chrono>
#include <ctype.h>
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <stdio.h>
#include <string.h>
#include <termios.h>
#include <unistd.h>

#include "Config.h"
#include "LogicUtils.h"
#include "Storage.h"
#include "SysfsHardwarePort.h"

// =================================================================================
// SECTION: CONSTRUCTION
// =================================================================================

SysfsHardwarePort::SysfsHardwarePort(IPlatformHAL &hal, const char *gpioRoot, const char *rfidDevice)
    : _hal(hal), _gpioRoot(gpioRoot), _rfidDevice(rfidDevice), _version(1), _stopReading(false) {
  memset(&_state, 0, sizeof(_state));
  memset(&_lastReported, 0, sizeof(_lastReported));
}

SysfsHardwarePort::~SysfsHardwarePort() { stopReader(); }

void SysfsHardwarePort::logKeyValue(const char *key, const char *value) {
  char tempBuf[MAX_LOG_LENGTH];
  snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
  _hal.log(tempBuf);
}

bool SysfsHardwarePort::initialize() {
  bool ok = true;

  ok &= exportLine(GPIO_LOCK_OUTSIDE, "out");
  ok &= exportLine(GPIO_LOCK_INSIDE, "out");
  ok &= exportLine(GPIO_RFID_POWER, "out");
  ok &= exportLine(GPIO_RFID_FIELD, "out");
  ok &= exportLine(GPIO_PIR_OUTSIDE_POWER, "out");
  ok &= exportLine(GPIO_PIR_INSIDE_POWER, "out");
  ok &= exportLine(GPIO_PIR_OUTSIDE, "in");
  ok &= exportLine(GPIO_PIR_INSIDE, "in");

  // Safe start: both directions locked, RFID dark, motion sensors powered
  ok &= writeLine(GPIO_LOCK_OUTSIDE, false);
  ok &= writeLine(GPIO_LOCK_INSIDE, false);
  ok &= writeLine(GPIO_RFID_FIELD, false);
  ok &= writeLine(GPIO_RFID_POWER, false);
  ok &= writeLine(GPIO_PIR_OUTSIDE_POWER, true);
  ok &= writeLine(GPIO_PIR_INSIDE_POWER, true);

  logKeyValue("Hardware", ok ? "GPIO lines initialized." : "GPIO initialization INCOMPLETE.");
  return ok;
}

// =================================================================================
// SECTION: GPIO HELPERS
// =================================================================================

bool SysfsHardwarePort::exportLine(int gpio, const char *direction) {
  std::string lineDir = joinPath(_gpioRoot, "gpio" + std::to_string(gpio));

  if (!isDirectory(lineDir)) {
    FILE *f = fopen(joinPath(_gpioRoot, "export").c_str(), "w");
    if (!f) {
      logKeyValue("Hardware", ("Export failed: " + std::string(strerror(errno))).c_str());
      return false;
    }
    fprintf(f, "%d", gpio);
    fclose(f);
    // udev needs a moment to hand over the new attributes
    _hal.sleepMs(100);
  }

  FILE *f = fopen(joinPath(lineDir, "direction").c_str(), "w");
  if (!f) {
    char logBuf[96];
    snprintf(logBuf, sizeof(logBuf), "GPIO %d direction: %s", gpio, strerror(errno));
    logKeyValue("Hardware", logBuf);
    return false;
  }
  fputs(direction, f);
  return fclose(f) == 0;
}

bool SysfsHardwarePort::writeLine(int gpio, bool high) {
  std::string path = joinPath(_gpioRoot, "gpio" + std::to_string(gpio) + "/value");
  int fd = open(path.c_str(), O_WRONLY);
  if (fd < 0) {
    char logBuf[96];
    snprintf(logBuf, sizeof(logBuf), "GPIO %d write: %s", gpio, strerror(errno));
    logKeyValue("Hardware", logBuf);
    return false;
  }
  ssize_t n = write(fd, high ? "1" : "0", 1);
  close(fd);
  return n == 1;
}

bool SysfsHardwarePort::readLine(int gpio, bool &high) {
  std::string path = joinPath(_gpioRoot, "gpio" + std::to_string(gpio) + "/value");
  int fd = open(path.c_str(), O_RDONLY);
  if (fd < 0) return false;
  char c = '0';
  ssize_t n = read(fd, &c, 1);
  close(fd);
  if (n != 1) return false;
  high = (c == '1');
  return true;
}

// =================================================================================
// SECTION: IHardwarePort
// =================================================================================

bool SysfsHardwarePort::readSnapshot(HardwareSnapshot &out) {
  bool outside = false;
  bool inside = true;
  bool ok = readLine(GPIO_PIR_OUTSIDE, outside) && readLine(GPIO_PIR_INSIDE, inside);

  std::lock_guard<std::mutex> lock(_mutex);
  if (ok) {
    _state.outerMotion = outside;
    _state.innerMotion = !inside;
  }
  if (LogicUtils::diffSnapshots(_state, _lastReported) != 0) {
    _version++;
    _lastReported = _state;
  }
  out = _state;
  out.version = _version;
  return ok;
}

bool SysfsHardwarePort::setLock(LockSide side, bool unlocked) {
  int gpio = (side == SIDE_INNER) ? GPIO_LOCK_INSIDE : GPIO_LOCK_OUTSIDE;
  if (!writeLine(gpio, unlocked)) return false;

  std::lock_guard<std::mutex> lock(_mutex);
  if (side == SIDE_INNER) _state.innerUnlocked = unlocked;
  else _state.outerUnlocked = unlocked;
  return true;
}

bool SysfsHardwarePort::setRfidPower(bool on) {
  if (!writeLine(GPIO_RFID_POWER, on)) return false;
  std::lock_guard<std::mutex> lock(_mutex);
  _state.rfidPowered = on;
  return true;
}

bool SysfsHardwarePort::setRfidField(bool on) {
  if (!writeLine(GPIO_RFID_FIELD, on)) return false;
  std::lock_guard<std::mutex> lock(_mutex);
  _state.rfidField = on;
  return true;
}

bool SysfsHardwarePort::setRfidReading(bool reading, uint32_t readCycles) {
  if (!reading) {
    stopReader();
    return true;
  }

  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_state.rfidReading) return true;
  }
  // A finished reader leaves a joinable thread behind
  stopReader();

  if (!setRfidField(true)) return false;

  std::lock_guard<std::mutex> lock(_mutex);
  _state.rfidReading = true;
  _stopReading = false;
  _readerThread = std::thread(&SysfsHardwarePort::readerLoop, this, readCycles);
  return true;
}

// =================================================================================
// SECTION: RFID READER
// =================================================================================

void SysfsHardwarePort::stopReader() {
  _stopReading = true;
  if (_readerThread.joinable()) _readerThread.join();
}

/**
 * One cycle = up to 1 s waiting for a line from the reader, then 100 ms pause.
 * readCycles == 0 reads until stopped.
 */
void SysfsHardwarePort::readerLoop(uint32_t readCycles) {
  char logBuf[96];
  int fd = open(_rfidDevice.c_str(), O_RDONLY | O_NOCTTY | O_NONBLOCK);
  if (fd < 0) {
    snprintf(logBuf, sizeof(logBuf), "RFID device %s: %s", _rfidDevice.c_str(), strerror(errno));
    logKeyValue("Hardware", logBuf);
  } else {
    struct termios tio;
    if (tcgetattr(fd, &tio) == 0) {
      cfmakeraw(&tio);
      cfsetispeed(&tio, B9600);
      cfsetospeed(&tio, B9600);
      tcsetattr(fd, TCSANOW, &tio);
    }

    std::string line;
    uint32_t cycle = 0;
    while (!_stopReading && (readCycles == 0 || cycle < readCycles)) {
      struct pollfd pfd;
      pfd.fd = fd;
      pfd.events = POLLIN;
      pfd.revents = 0;

      if (poll(&pfd, 1, 1000) > 0 && (pfd.revents & POLLIN)) {
        char buf[64];
        ssize_t n = read(fd, buf, sizeof(buf));
        for (ssize_t i = 0; i < n; i++) {
          if (buf[i] != '\n' && buf[i] != '\r') {
            if (isxdigit((unsigned char)buf[i])) line.push_back(buf[i]);
            continue;
          }
          if (line.empty()) continue;

          std::lock_guard<std::mutex> lock(_mutex);
          LogicUtils::copyString(_state.rfidTag, sizeof(_state.rfidTag), line.c_str());
          _state.rfidTimestampMs = (uint64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
                                       std::chrono::system_clock::now().time_since_epoch())
                                       .count();
          line.clear();
        }
      }
      _hal.sleepMs(100);
      cycle++;
    }
    close(fd);
  }

  writeLine(GPIO_RFID_FIELD, false);
  std::lock_guard<std::mutex> lock(_mutex);
  _state.rfidField = false;
  _state.rfidReading = false;
}
