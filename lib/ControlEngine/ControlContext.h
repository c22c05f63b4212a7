/*
 * =================================================================================
 * File:      lib/ControlEngine/ControlContext.h
 * Description: Abstraction layer (HAL) for the platform, the hardware port and the
 * local autonomous service.
 * =================================================================================
 */
#pragma once
#include "Types.h"

// Services every component needs, on the target and on the remote.
class IPlatformHAL {
public:
    virtual ~IPlatformHAL() {}

    // --- Logging ---
    virtual void log(const char* message) = 0;

    // --- Utils ---
    virtual unsigned long getMillis() = 0;
    virtual void sleepMs(uint32_t ms) = 0;
    virtual uint32_t getRandom(uint32_t min, uint32_t max) = 0;
};

// Target-only side effects of session transitions.
class IControlHAL : public IPlatformHAL {
public:
    virtual ~IControlHAL() {}

    // --- Info Page ---
    // Raised while a remote owns the hardware. The port-80 collaborator
    // serves the "controlled remotely" notice while it is up.
    virtual void setRemoteNotice(bool active, const char* ownerEndpoint) = 0;

    // --- Storage ---
    // Persists that remote control was requested at least once (boot wait).
    virtual void markRemoteControlUsed() = 0;
};

// Sensors and actuators of the flap. Implementations must be safe to call
// from several threads; the gate serializes writes but not reads.
class IHardwarePort {
public:
    virtual ~IHardwarePort() {}

    // --- Sensors ---
    virtual bool readSnapshot(HardwareSnapshot& out) = 0;

    // --- Actuators ---
    // All writes return false on a hardware fault.
    virtual bool setLock(LockSide side, bool unlocked) = 0;
    virtual bool setRfidPower(bool on) = 0;
    virtual bool setRfidField(bool on) = 0;
    virtual bool setRfidReading(bool reading, uint32_t readCycles) = 0;
};

// The target's own decision service.
class IAutonomousFallback {
public:
    virtual ~IAutonomousFallback() {}

    virtual bool stop() = 0;
    virtual bool start() = 0;
    virtual bool isRunning() = 0;
};

// Outbound notifications of the session manager. Called without any
// manager lock held.
class IControlListener {
public:
    virtual ~IControlListener() {}

    virtual void onCommandCompleted(const char* sessionId, uint32_t sequence, CommandKind kind,
                                    RejectReason result, const SnapshotDelta& delta) = 0;
    virtual void onSessionReleased(const char* sessionId, ReleaseReason reason) = 0;
};
