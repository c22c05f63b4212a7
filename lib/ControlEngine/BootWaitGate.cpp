/*
 * =================================================================================
 * File:      lib/ControlEngine/BootWaitGate.cpp
 * =================================================================================
 */
#include "BootWaitGate.h"
#include "TimeUtils.h"

BootWaitGate::BootWaitGate() : _holding(false), _startedAt(0), _timeoutMs(0) {}

bool BootWaitGate::begin(unsigned long now, bool markerPresent, uint32_t timeoutMs) {
    _holding = markerPresent;
    _startedAt = now;
    _timeoutMs = timeoutMs;
    return _holding;
}

BootWaitAction BootWaitGate::tick(unsigned long now, ControlState state) {
    if (!_holding) return BOOT_WAIT_NONE;

    // A claim owns the fallback from here on, the release path restarts it.
    if (state != IDLE) {
        _holding = false;
        return BOOT_WAIT_HANDED_OVER;
    }

    if (TimeUtils::elapsedSince(_startedAt, now) >= _timeoutMs) {
        _holding = false;
        return BOOT_WAIT_RESUME_FALLBACK;
    }
    return BOOT_WAIT_NONE;
}

unsigned long BootWaitGate::remaining(unsigned long now) const {
    if (!_holding) return 0;
    unsigned long elapsed = TimeUtils::elapsedSince(_startedAt, now);
    return (elapsed >= _timeoutMs) ? 0 : _timeoutMs - elapsed;
}
