/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      lib/ControlEngine/ControlSession.cpp
 *
 * Description:
 * Core session logic.
 * - Uses 'changeState' for every transition of the single ControlSession.
 * - Uses 'IInterlockRules' for the both-sides-open policy.
 * - Hardware writes go through HardwareGate, on the executor thread only
 *   (plus the Safety Shutdown Sequence, after the executor is idle).
 * =================================================================================
 */
#include <stdio.h>
#include <string.h>

#include "ControlSession.h"
#include "LogicUtils.h"
#include "TimeUtils.h"

// =================================================================================
// SECTION: CONSTRUCTOR & INIT
// =================================================================================

ControlSessionManager::ControlSessionManager(IControlHAL& hal,
                                             IHardwarePort& port,
                                             IAutonomousFallback& fallback,
                                             IInterlockRules& rules,
                                             const ControlTimings& timings)
    : _hal(hal),
      _fallback(fallback),
      _rules(rules),
      _gate(port, hal, timings.commandSpacingMs),
      _listener(nullptr),
      _timings(timings),
      _inFlight(false),
      _executorStopping(false),
      _projectedInner(false),
      _projectedOuter(false),
      _claimCounter(0),
      _generation(0)
{
    memset(&_session, 0, sizeof(_session));
    _session.state = IDLE;

    // No session: the local service is the only legitimate writer.
    _gate.designateWriter(WRITER_LOCAL);
}

void ControlSessionManager::setListener(IControlListener* listener) {
    _listener = listener;
}

// =================================================================================
// SECTION: INTERNAL HELPERS (Logging & Utils)
// =================================================================================

void ControlSessionManager::logKeyValue(const char* key, const char* value) {
    char tempBuf[MAX_LOG_LENGTH];
    // Format: " Key : Value"
    snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
    _hal.log(tempBuf);
}

bool ControlSessionManager::matchesSession(const char* sessionId) const {
    if (!sessionId || sessionId[0] == '\0') return false;
    if (_session.sessionId[0] == '\0') return false;
    return strcmp(sessionId, _session.sessionId) == 0;
}

static void projectCommand(CommandKind kind, bool& inner, bool& outer) {
    switch (kind) {
    case CMD_LOCK_INNER:   inner = false; break;
    case CMD_UNLOCK_INNER: inner = true; break;
    case CMD_LOCK_OUTER:   outer = false; break;
    case CMD_UNLOCK_OUTER: outer = true; break;
    default: break;
    }
}

static RejectReason gateToReject(GateResult r) {
    switch (r) {
    case GATE_APPLIED:      return REJECT_NONE;
    case GATE_WRONG_WRITER: return REJECT_NOT_ACTIVE;
    case GATE_INTERLOCK:    return REJECT_INTERLOCK;
    default:                return REJECT_HARDWARE_FAULT;
    }
}

/**
 * Rebuilds the projected lock state from the real hardware plus whatever is
 * still waiting in the queue.
 */
void ControlSessionManager::resyncProjection() {
    HardwareSnapshot snap;
    memset(&snap, 0, sizeof(snap));
    bool ok = _gate.readSnapshot(snap);

    std::lock_guard<std::mutex> lock(_mutex);
    if (ok) {
        _projectedInner = snap.innerUnlocked;
        _projectedOuter = snap.outerUnlocked;
    }
    for (const QueuedCommand& q : _queue) {
        if (q.hasCorrection) projectCommand(q.correction, _projectedInner, _projectedOuter);
        projectCommand(q.command.kind, _projectedInner, _projectedOuter);
    }
}

void ControlSessionManager::printStartupDiagnostics() {
    char logBuf[128];
    char timeStr[48];

    _hal.log("==========================================================================");
    _hal.log("                     CONTROL SESSION DIAGNOSTICS                          ");
    _hal.log("==========================================================================");

    _hal.log("[ SESSION STATE ]");
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Current State", stateToString(getState()));
    _hal.log(logBuf);

    const char* writerStr = "NONE";
    HardwareWriter w = _gate.getWriter();
    if (w == WRITER_LOCAL) writerStr = "LOCAL SERVICE";
    else if (w == WRITER_SESSION) writerStr = "REMOTE SESSION";
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Hardware Writer", writerStr);
    _hal.log(logBuf);

    _hal.log("");
    _hal.log("[ TIMINGS ]");

    TimeUtils::formatMillis(_timings.controlTimeoutMs, timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Heartbeat Timeout (T)", timeStr);
    _hal.log(logBuf);

    TimeUtils::formatMillis(_timings.settleDelayMs, timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Settle Delay", timeStr);
    _hal.log(logBuf);

    TimeUtils::formatMillis(_timings.commandSpacingMs, timeStr, sizeof(timeStr));
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Command Spacing", timeStr);
    _hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-25s : %u ms", "Watchdog Resolution", _timings.watchdogPollMs);
    _hal.log(logBuf);

    _hal.log("");
    _hal.log("[ SAFETY ]");

    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Interlock Mode",
             _rules.getMode() == INTERLOCK_CORRECT ? "CORRECT (lock opposite side)" : "REJECT");
    _hal.log(logBuf);

    snprintf(logBuf, sizeof(logBuf), " %-25s : %d", "Command Queue Capacity", COMMAND_QUEUE_CAPACITY);
    _hal.log(logBuf);
}

// =================================================================================
// SECTION: STATE TRANSITION SYSTEM
// =================================================================================

/**
 * Centralized state transition. All changes of _session.state go through here.
 * Caller holds _mutex.
 */
void ControlSessionManager::changeState(ControlState newState) {
    if (_session.state == newState) return;

    _session.state = newState;

    char logBuf[64];
    snprintf(logBuf, sizeof(logBuf), ">>> STATE CHANGE: %s", stateToString(newState));
    logKeyValue("Session", logBuf);
}

void ControlSessionManager::clearSession() {
    _session.sessionId[0] = '\0';
    _session.ownerEndpoint[0] = '\0';
    _session.startedAt = 0;
    _session.lastHeartbeatAt = 0;
    _session.lastSequence = 0;
}

// =================================================================================
// SECTION: CLAIM
// =================================================================================

ClaimResult ControlSessionManager::claim(const char* endpoint, char* outSessionId, size_t outSize) {
    char logBuf[128];
    char sessionId[SESSION_ID_LENGTH + 1];
    uint32_t generation = 0;

    if (outSessionId && outSize > 0) outSessionId[0] = '\0';
    if (!endpoint) endpoint = "";

    // Any attempt counts for the boot-wait marker, successful or not.
    _hal.markRemoteControlUsed();

    // 1. Atomic check-and-set against concurrent claims and watchdog expiry
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _claimCounter++;

        if (_session.state != IDLE) {
            snprintf(logBuf, sizeof(logBuf), "Claim by '%s' rejected: AlreadyOwned (%s)", endpoint,
                     stateToString(_session.state));
            logKeyValue("Session", logBuf);
            return CLAIM_ALREADY_OWNED;
        }

        unsigned long now = _hal.getMillis();
        LogicUtils::formatSessionId(_session.sessionId, sizeof(_session.sessionId), _claimCounter,
                                    _hal.getRandom(0, 0xFFFFFFFFu));
        LogicUtils::copyString(_session.ownerEndpoint, sizeof(_session.ownerEndpoint), endpoint);
        _session.startedAt = now;
        _session.lastHeartbeatAt = now;
        _session.lastSequence = 0;
        _session.generation = ++_generation;
        generation = _session.generation;
        LogicUtils::copyString(sessionId, sizeof(sessionId), _session.sessionId);

        changeState(CLAIMED);
        _watchdog.arm(now, _timings.controlTimeoutMs);

        snprintf(logBuf, sizeof(logBuf), "Claim by '%s' accepted. Session %s", endpoint, sessionId);
        logKeyValue("Session", logBuf);
    }

    std::lock_guard<std::mutex> transition(_transitionMutex);

    // 2. Hand-over: the local service must be down before anything else writes
    if (!_fallback.stop()) {
        logKeyValue("Session", "Claim aborted: local service did not stop.");
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _watchdog.disarm();
            clearSession();
            changeState(IDLE);
        }
        // A stop that timed out may still have taken effect
        _gate.designateWriter(WRITER_LOCAL);
        if (!_fallback.isRunning()) {
            if (_fallback.start()) {
                logKeyValue("Session", "Local service restarted.");
            } else {
                logKeyValue("Session", "CRITICAL: Local service failed to start.");
            }
        }
        return CLAIM_FALLBACK_BUSY;
    }

    // 3. Settle: in-flight local hardware operations finish before remote commands
    snprintf(logBuf, sizeof(logBuf), "Local service stopped. Settling for %u ms.", _timings.settleDelayMs);
    logKeyValue("Session", logBuf);
    _hal.sleepMs(_timings.settleDelayMs);

    _gate.designateWriter(WRITER_SESSION);
    resyncProjection();
    _hal.setRemoteNotice(true, endpoint);

    // 4. Declare ACTIVE
    std::lock_guard<std::mutex> lock(_mutex);
    if (_session.state != CLAIMED || _session.generation != generation) {
        logKeyValue("Session", "Claim aborted: session changed during settle.");
        return CLAIM_ABORTED;
    }

    changeState(ACTIVE);
    _watchdog.feed(_hal.getMillis());

    if (outSessionId && outSize > 0) LogicUtils::copyString(outSessionId, outSize, sessionId);
    return CLAIM_ACCEPTED;
}

// =================================================================================
// SECTION: HEARTBEAT & WATCHDOG
// =================================================================================

bool ControlSessionManager::heartbeat(const char* sessionId, uint64_t remoteTimestamp) {
    (void)remoteTimestamp;
    std::lock_guard<std::mutex> lock(_mutex);

    if ((_session.state != CLAIMED && _session.state != ACTIVE) || !matchesSession(sessionId)) {
        char logBuf[96];
        snprintf(logBuf, sizeof(logBuf), "Heartbeat ignored: stale session '%s'", sessionId ? sessionId : "");
        logKeyValue("Watchdog", logBuf);
        return false;
    }

    unsigned long now = _hal.getMillis();
    _session.lastHeartbeatAt = now;
    _watchdog.feed(now);
    return true;
}

bool ControlSessionManager::extendDeadline(const char* sessionId) {
    std::lock_guard<std::mutex> lock(_mutex);
    if ((_session.state != CLAIMED && _session.state != ACTIVE) || !matchesSession(sessionId)) return false;
    _watchdog.feed(_hal.getMillis());
    return true;
}

/**
 * Called by the watchdog task. Detection happens under the state lock; the
 * release itself runs on the calling (watchdog) thread.
 */
bool ControlSessionManager::checkWatchdog() {
    char sessionId[SESSION_ID_LENGTH + 1];
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_session.state != CLAIMED && _session.state != ACTIVE) return false;

        unsigned long now = _hal.getMillis();
        if (!_watchdog.pollExpired(now)) return false;

        char logBuf[128];
        snprintf(logBuf, sizeof(logBuf), "No heartbeat for %lu ms (T=%u ms). Forcing release of %s.",
                 TimeUtils::elapsedSince(_session.lastHeartbeatAt, now), _timings.controlTimeoutMs,
                 _session.sessionId);
        logKeyValue("Watchdog", logBuf);
        LogicUtils::copyString(sessionId, sizeof(sessionId), _session.sessionId);
    }

    return release(sessionId, RELEASE_WATCHDOG_TIMEOUT);
}

// =================================================================================
// SECTION: COMMAND DISPATCH
// =================================================================================

RejectReason ControlSessionManager::dispatch(const CommandMessage& command) {
    char logBuf[128];
    std::lock_guard<std::mutex> lock(_mutex);

    if (!matchesSession(command.sessionId)) {
        snprintf(logBuf, sizeof(logBuf), "Command %s rejected: session '%s' is not current",
                 commandToString(command.kind), command.sessionId);
        logKeyValue("Session", logBuf);
        return REJECT_AUTHORIZATION;
    }

    if (_session.state != ACTIVE) return REJECT_NOT_ACTIVE;

    if (command.kind >= CMD_UNKNOWN) return REJECT_UNKNOWN_COMMAND;

    if (command.sequence <= _session.lastSequence) {
        snprintf(logBuf, sizeof(logBuf), "Possible replay/reorder: seq %u <= last accepted %u (%s)",
                 command.sequence, _session.lastSequence, commandToString(command.kind));
        logKeyValue("Session", logBuf);
        return REJECT_SEQUENCE;
    }

    InterlockVerdict verdict = _rules.evaluate(_projectedInner, _projectedOuter, command.kind);
    if (!verdict.allowed) {
        snprintf(logBuf, sizeof(logBuf), "INTERLOCK: %s (seq %u) rejected, opposite side open",
                 commandToString(command.kind), command.sequence);
        logKeyValue("Session", logBuf);
        return REJECT_INTERLOCK;
    }

    if (_queue.size() >= COMMAND_QUEUE_CAPACITY) return REJECT_QUEUE_FULL;

    QueuedCommand q;
    q.command = command;
    q.hasCorrection = verdict.needsCorrection;
    q.correction = verdict.correction;
    q.generation = _session.generation;
    _queue.push_back(q);

    _session.lastSequence = command.sequence;
    if (q.hasCorrection) projectCommand(q.correction, _projectedInner, _projectedOuter);
    projectCommand(command.kind, _projectedInner, _projectedOuter);

    _cv.notify_all();
    return REJECT_NONE;
}

/**
 * Hardware executor step. Pops one accepted command, applies it through the
 * gate and reports the outcome. Returns false when nothing was executed.
 */
bool ControlSessionManager::executeNext(uint32_t waitMs) {
    QueuedCommand job;
    {
        std::unique_lock<std::mutex> lock(_mutex);
        if (_queue.empty() && waitMs > 0 && !_executorStopping) {
            _cv.wait_for(lock, std::chrono::milliseconds(waitMs),
                         [this] { return !_queue.empty() || _executorStopping; });
        }
        if (_queue.empty() || _executorStopping) return false;

        job = _queue.front();
        _queue.pop_front();

        if (job.generation != _session.generation || _session.state != ACTIVE) return false;
        _inFlight = true;
    }

    char logBuf[128];
    HardwareSnapshot before;
    HardwareSnapshot after;
    memset(&before, 0, sizeof(before));
    memset(&after, 0, sizeof(after));
    bool haveBefore = _gate.readSnapshot(before);

    GateResult result = GATE_APPLIED;
    if (job.hasCorrection) {
        snprintf(logBuf, sizeof(logBuf), "INTERLOCK: correcting with %s before %s",
                 commandToString(job.correction), commandToString(job.command.kind));
        logKeyValue("Session", logBuf);
        result = _gate.apply(WRITER_SESSION, job.correction, 0);
    }
    if (result == GATE_APPLIED) {
        result = _gate.apply(WRITER_SESSION, job.command.kind, job.command.readCycles);
    }
    _gate.readSnapshot(after);

    SnapshotDelta delta;
    delta.current = after;
    delta.changedMask = haveBefore ? LogicUtils::diffSnapshots(before, after) : (uint16_t)FIELD_ALL;

    RejectReason outcome = gateToReject(result);

    {
        std::lock_guard<std::mutex> lock(_mutex);
        _inFlight = false;
    }
    _cv.notify_all();

    if (outcome != REJECT_NONE) {
        resyncProjection();
        snprintf(logBuf, sizeof(logBuf), "%s (seq %u) failed: %s", commandToString(job.command.kind),
                 job.command.sequence, rejectToString(outcome));
        logKeyValue("Hardware", logBuf);
    }

    if (_listener) {
        _listener->onCommandCompleted(job.command.sessionId, job.command.sequence, job.command.kind, outcome, delta);
    }

    // A lock that may be in an unknown position is unsafe to leave with the remote.
    if (outcome == REJECT_HARDWARE_FAULT &&
        (LogicUtils::isLockCommand(job.command.kind) || job.hasCorrection)) {
        logKeyValue("Session", "Unsafe hardware fault on a lock. Releasing session.");
        release(job.command.sessionId, RELEASE_HARDWARE_FAULT);
    }

    return true;
}

void ControlSessionManager::stopExecutor() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        _executorStopping = true;
    }
    _cv.notify_all();
}

// =================================================================================
// SECTION: RELEASE & SAFETY SHUTDOWN
// =================================================================================

void ControlSessionManager::runSafetyShutdown() {
    static const CommandKind SHUTDOWN_SEQUENCE[] = {
        CMD_RFID_READ_STOP,
        CMD_RFID_FIELD_OFF,
        CMD_RFID_POWER_OFF,
        CMD_LOCK_OUTER,
        CMD_LOCK_INNER,
    };

    logKeyValue("Session", "Safety shutdown: RFID off, outer then inner lock.");
    _gate.designateWriter(WRITER_SESSION);

    for (size_t i = 0; i < sizeof(SHUTDOWN_SEQUENCE) / sizeof(SHUTDOWN_SEQUENCE[0]); i++) {
        GateResult r = _gate.apply(WRITER_SESSION, SHUTDOWN_SEQUENCE[i], 0);
        if (r != GATE_APPLIED) {
            char logBuf[96];
            snprintf(logBuf, sizeof(logBuf), "Shutdown step %s FAILED (%s)", commandToString(SHUTDOWN_SEQUENCE[i]),
                     rejectToString(gateToReject(r)));
            logKeyValue("Session", logBuf);
        }
    }
}

/**
 * Ends the current session. Idempotent: returns false without side effects
 * when already IDLE/RELEASING or when 'sessionId' is stale.
 * A null 'sessionId' releases whatever session is current.
 */
bool ControlSessionManager::release(const char* sessionId, ReleaseReason reason) {
    std::lock_guard<std::mutex> transition(_transitionMutex);

    char releasedId[SESSION_ID_LENGTH + 1];
    char logBuf[128];
    unsigned long startedAt = 0;
    size_t discarded = 0;

    {
        std::unique_lock<std::mutex> lock(_mutex);
        if (_session.state == IDLE || _session.state == RELEASING) return false;
        if (sessionId != nullptr && !matchesSession(sessionId)) {
            snprintf(logBuf, sizeof(logBuf), "Release ignored: stale session '%s'", sessionId);
            logKeyValue("Session", logBuf);
            return false;
        }

        LogicUtils::copyString(releasedId, sizeof(releasedId), _session.sessionId);
        startedAt = _session.startedAt;

        changeState(RELEASING);
        _watchdog.disarm();

        // Queued commands are discarded, never drained
        discarded = _queue.size();
        _queue.clear();
        _cv.wait(lock, [this] { return !_inFlight; });
    }

    snprintf(logBuf, sizeof(logBuf), "Release Source: %s (%u queued commands discarded)", releaseToString(reason),
             (unsigned)discarded);
    logKeyValue("Session", logBuf);

    runSafetyShutdown();
    _hal.setRemoteNotice(false, "");

    _gate.designateWriter(WRITER_LOCAL);
    if (_fallback.start()) {
        logKeyValue("Session", "Local service restarted.");
    } else {
        logKeyValue("Session", "CRITICAL: Local service failed to start.");
    }

    {
        std::lock_guard<std::mutex> lock(_mutex);
        char timeStr[48];
        TimeUtils::formatMillis(TimeUtils::elapsedSince(startedAt, _hal.getMillis()), timeStr, sizeof(timeStr));
        snprintf(logBuf, sizeof(logBuf), "Session %s ended after %s", releasedId, timeStr);
        logKeyValue("Session", logBuf);

        clearSession();
        changeState(IDLE);
    }

    if (_listener) _listener->onSessionReleased(releasedId, reason);
    return true;
}

void ControlSessionManager::forceRelease(ReleaseReason reason) {
    release(nullptr, reason);
}

/**
 * While a session holds the hardware the local service must stay down.
 * Returns true when the service was found running and was stopped again.
 */
bool ControlSessionManager::enforceFallbackStopped() {
    {
        std::lock_guard<std::mutex> lock(_mutex);
        if (_session.state != ACTIVE) return false;
    }

    if (!_fallback.isRunning()) return false;

    logKeyValue("Session", "Local service active during remote control. Stopping it.");
    if (!_fallback.stop()) {
        logKeyValue("Session", "CRITICAL: Could not stop local service.");
    }
    return true;
}

// =================================================================================
// SECTION: BOOT WAIT
// =================================================================================

/**
 * Keeps the local service down with the notice raised while no session exists
 * yet. Used right after boot when the target was remote controlled before.
 */
bool ControlSessionManager::holdLocalControl(const char* notice) {
    std::lock_guard<std::mutex> transition(_transitionMutex);
    if (getState() != IDLE) return false;

    if (!_fallback.stop()) {
        logKeyValue("Session", "Boot wait: local service did not stop.");
        return false;
    }
    _hal.setRemoteNotice(true, notice);
    logKeyValue("Session", "Boot wait: holding local service for remote re-claim.");
    return true;
}

// Ends a boot wait that nobody claimed. No-op while a session exists.
bool ControlSessionManager::resumeLocalControl() {
    std::lock_guard<std::mutex> transition(_transitionMutex);
    if (getState() != IDLE) return false;

    _hal.setRemoteNotice(false, "");
    _gate.designateWriter(WRITER_LOCAL);
    if (!_fallback.start()) {
        logKeyValue("Session", "CRITICAL: Local service failed to start.");
        return false;
    }
    logKeyValue("Session", "Boot wait over. Local service resumed.");
    return true;
}

// =================================================================================
// SECTION: ACCESSORS
// =================================================================================

ControlState ControlSessionManager::getState() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _session.state;
}

bool ControlSessionManager::getSession(ControlSession& out) const {
    std::lock_guard<std::mutex> lock(_mutex);
    out = _session;
    return _session.state != IDLE;
}

bool ControlSessionManager::isOwner(const char* sessionId) const {
    std::lock_guard<std::mutex> lock(_mutex);
    return (_session.state == CLAIMED || _session.state == ACTIVE) && matchesSession(sessionId);
}

size_t ControlSessionManager::getQueuedCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _queue.size();
}

uint32_t ControlSessionManager::getClaimAttempts() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _claimCounter;
}
