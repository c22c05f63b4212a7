/*
 * =================================================================================
 * File:      lib/ControlEngine/ReconnectBackoff.cpp
 * =================================================================================
 */
#include "ReconnectBackoff.h"

ReconnectBackoff::ReconnectBackoff(IPlatformHAL& hal, uint32_t initialMs, uint32_t capMs, uint32_t jitterPct)
    : _hal(hal), _initialMs(initialMs), _capMs(capMs), _jitterPct(jitterPct), _attempts(0), _lastDelay(0) {
    if (_initialMs == 0) _initialMs = 1;
    if (_capMs < _initialMs) _capMs = _initialMs;
    if (_jitterPct > 100) _jitterPct = 100;
}

void ReconnectBackoff::reset() {
    _attempts = 0;
    _lastDelay = 0;
}

uint32_t ReconnectBackoff::nextDelay() {
    // initial * 2^attempts, computed wide and capped
    uint64_t base = _initialMs;
    for (uint32_t i = 0; i < _attempts && base < _capMs; i++) {
        base *= 2;
    }
    if (base > _capMs) base = _capMs;

    uint64_t jitter = 0;
    uint32_t jitterSpan = (uint32_t)((base * _jitterPct) / 100);
    if (jitterSpan > 0) {
        jitter = _hal.getRandom(0, jitterSpan);
    }

    uint64_t delay = base + jitter;
    if (delay > _capMs) delay = _capMs;
    if (delay < _lastDelay) delay = _lastDelay;

    _lastDelay = (uint32_t)delay;
    _attempts++;
    return _lastDelay;
}
