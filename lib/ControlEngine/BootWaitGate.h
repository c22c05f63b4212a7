/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      lib/ControlEngine/BootWaitGate.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Boot-time hold-off for the local service. When the target was remote
 * controlled before (boot marker present) the local service stays down for a
 * while after reboot so the remote can re-claim without a hand-over.
 * Pure timing logic; the caller performs the returned action.
 * =================================================================================
 */
#pragma once
#include "Types.h"

enum BootWaitAction : uint8_t {
    BOOT_WAIT_NONE,            // Still waiting, or no wait in progress
    BOOT_WAIT_RESUME_FALLBACK, // Timed out with nobody in control
    BOOT_WAIT_HANDED_OVER      // A session took over before the timeout
};

class BootWaitGate {
public:
    BootWaitGate();

    // Returns true when a wait was started.
    bool begin(unsigned long now, bool markerPresent, uint32_t timeoutMs);
    BootWaitAction tick(unsigned long now, ControlState state);

    bool isHolding() const { return _holding; }
    unsigned long remaining(unsigned long now) const;

private:
    bool _holding;
    unsigned long _startedAt;
    uint32_t _timeoutMs;
};
