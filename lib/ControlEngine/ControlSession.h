/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      lib/ControlEngine/ControlSession.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Header for the ControlSessionManager class.
 *
 * NOTES:
 * 1. Owns the one ControlSession value; every mutation goes through changeState().
 * 2. Decoupled from the platform via IControlHAL / IHardwarePort / IAutonomousFallback.
 * 3. Interlock policy injected via IInterlockRules.
 * 4. Clock-driven entry points (checkWatchdog, executeNext) are called by
 *    dedicated threads owned by the application.
 * =================================================================================
 */
#pragma once
#include <condition_variable>
#include <deque>
#include <mutex>

#include "ControlContext.h"
#include "HardwareGate.h"
#include "HeartbeatWatchdog.h"
#include "InterlockRules.h"
#include "Types.h"

class ControlSessionManager {
public:
    ControlSessionManager(IControlHAL& hal,
                          IHardwarePort& port,
                          IAutonomousFallback& fallback,
                          IInterlockRules& rules,
                          const ControlTimings& timings);

    void setListener(IControlListener* listener);

    // --- Session Operations ---
    ClaimResult claim(const char* endpoint, char* outSessionId, size_t outSize);
    bool heartbeat(const char* sessionId, uint64_t remoteTimestamp);
    RejectReason dispatch(const CommandMessage& command);
    bool release(const char* sessionId, ReleaseReason reason);
    void forceRelease(ReleaseReason reason);

    // Pushes the deadline out while the owner's sync stream is being sent.
    bool extendDeadline(const char* sessionId);

    // --- Clock-Driven Entry Points ---
    bool checkWatchdog();
    bool executeNext(uint32_t waitMs);
    void stopExecutor();
    bool enforceFallbackStopped();

    // --- Boot Wait ---
    bool holdLocalControl(const char* notice);
    bool resumeLocalControl();

    // --- State Accessors (Read-Only) ---
    ControlState getState() const;
    bool getSession(ControlSession& out) const;
    bool isOwner(const char* sessionId) const;
    size_t getQueuedCount() const;
    uint32_t getClaimAttempts() const;
    HardwareWriter getWriter() const { return _gate.getWriter(); }
    const ControlTimings& getTimings() const { return _timings; }
    bool readSnapshot(HardwareSnapshot& out) { return _gate.readSnapshot(out); }

    void printStartupDiagnostics();

private:
    struct QueuedCommand {
        CommandMessage command;
        bool hasCorrection;
        CommandKind correction;
        uint32_t generation;
    };

    // --- Dependencies ---
    IControlHAL& _hal;
    IAutonomousFallback& _fallback;
    IInterlockRules& _rules;
    HardwareGate _gate;
    IControlListener* _listener;

    // --- Configuration ---
    ControlTimings _timings;

    // --- Dynamic State ---
    mutable std::mutex _mutex;
    std::condition_variable _cv;
    std::mutex _transitionMutex; // Serializes claim() and release()

    ControlSession _session;
    HeartbeatWatchdog _watchdog;
    std::deque<QueuedCommand> _queue;
    bool _inFlight;
    bool _executorStopping;

    // Lock state as it will be once the queue has drained
    bool _projectedInner;
    bool _projectedOuter;

    uint32_t _claimCounter;
    uint32_t _generation;

    // =========================================================================
    // SECTION: STATE TRANSITION SYSTEM
    // =========================================================================

    void changeState(ControlState newState); // Caller holds _mutex
    void clearSession();                     // Caller holds _mutex

    // =========================================================================
    // SECTION: LOGIC HELPERS
    // =========================================================================

    bool matchesSession(const char* sessionId) const; // Caller holds _mutex
    void runSafetyShutdown();
    void resyncProjection();
    void logKeyValue(const char* key, const char* value);
};
