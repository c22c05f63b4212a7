/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      lib/ControlEngine/ReconnectBackoff.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Reconnect delay generator for the remote client. Exponential growth from the
 * initial delay, capped, with additive jitter. Delays never decrease until
 * reset(), and stay constant once the cap is reached.
 * =================================================================================
 */
#pragma once
#include "ControlContext.h"

class ReconnectBackoff {
public:
    ReconnectBackoff(IPlatformHAL& hal, uint32_t initialMs, uint32_t capMs, uint32_t jitterPct);

    // Delay before the next attempt. Advances the attempt counter.
    uint32_t nextDelay();

    // Called after a successful claim.
    void reset();

    uint32_t getAttempts() const { return _attempts; }
    uint32_t getLastDelay() const { return _lastDelay; }

private:
    IPlatformHAL& _hal;
    uint32_t _initialMs;
    uint32_t _capMs;
    uint32_t _jitterPct;

    uint32_t _attempts;
    uint32_t _lastDelay;
};
