/*
 * =================================================================================
 * File:      lib/ControlEngine/HeartbeatWatchdog.cpp
 * =================================================================================
 */
#include "HeartbeatWatchdog.h"

HeartbeatWatchdog::HeartbeatWatchdog() : _armed(false), _fired(false), _deadline(0), _timeoutMs(0) {}

void HeartbeatWatchdog::arm(unsigned long now, uint32_t timeoutMs) {
    _timeoutMs = timeoutMs;
    _deadline = now + timeoutMs;
    _armed = true;
    _fired = false;
}

void HeartbeatWatchdog::feed(unsigned long now) {
    // A fired watchdog stays fired; the session is already being released.
    if (!_armed || _fired) return;
    _deadline = now + _timeoutMs;
}

void HeartbeatWatchdog::disarm() {
    _armed = false;
    _deadline = 0;
}

bool HeartbeatWatchdog::pollExpired(unsigned long now) {
    if (!_armed || _fired) return false;
    if (now < _deadline) return false;
    _fired = true;
    return true;
}

unsigned long HeartbeatWatchdog::remaining(unsigned long now) const {
    if (!_armed || now >= _deadline) return 0;
    return _deadline - now;
}
