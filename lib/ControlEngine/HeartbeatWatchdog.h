/*
 * =================================================================================
 * File:      lib/ControlEngine/HeartbeatWatchdog.h
 * Description:
 * Liveness deadline for one control session. Pure time arithmetic; the owner
 * provides the clock and the locking. Fires at most once per arm().
 * =================================================================================
 */
#pragma once
#include "Types.h"

class HeartbeatWatchdog {
public:
    HeartbeatWatchdog();

    void arm(unsigned long now, uint32_t timeoutMs);
    void feed(unsigned long now);
    void disarm();

    // True exactly once, on the first poll at or past the deadline.
    bool pollExpired(unsigned long now);

    bool isArmed() const { return _armed; }
    bool hasFired() const { return _fired; }
    unsigned long getDeadline() const { return _deadline; }
    uint32_t getTimeout() const { return _timeoutMs; }
    unsigned long remaining(unsigned long now) const;

private:
    bool _armed;
    bool _fired;
    unsigned long _deadline;
    uint32_t _timeoutMs;
};
