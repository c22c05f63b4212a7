/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      lib/ControlEngine/HardwareGate.cpp
 * =================================================================================
 */
#include <stdio.h>

#include "HardwareGate.h"
#include "StandardInterlock.h"

HardwareGate::HardwareGate(IHardwarePort& port, IPlatformHAL& hal, uint32_t commandSpacingMs)
    : _port(port),
      _hal(hal),
      _spacingMs(commandSpacingMs),
      _writer(WRITER_LOCAL),
      _lastWriteAt(0),
      _hasWritten(false),
      _writeCount(0)
{
}

void HardwareGate::designateWriter(HardwareWriter writer) {
    std::lock_guard<std::mutex> lock(_mutex);
    _writer = writer;
}

HardwareWriter HardwareGate::getWriter() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _writer;
}

uint32_t HardwareGate::getWriteCount() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _writeCount;
}

bool HardwareGate::readSnapshot(HardwareSnapshot& out) {
    return _port.readSnapshot(out);
}

/**
 * Sleeps until the spacing since the previous write has elapsed.
 * Caller holds _mutex.
 */
void HardwareGate::waitForSpacing() {
    if (!_hasWritten || _spacingMs == 0) return;

    unsigned long elapsed = _hal.getMillis() - _lastWriteAt;
    if (elapsed < _spacingMs) {
        _hal.sleepMs((uint32_t)(_spacingMs - elapsed));
    }
}

GateResult HardwareGate::apply(HardwareWriter who, CommandKind kind, uint32_t readCycles) {
    std::lock_guard<std::mutex> lock(_mutex);

    if (who != _writer || who == WRITER_NONE) {
        char logBuf[96];
        snprintf(logBuf, sizeof(logBuf), " %-8s : Write %s refused (not the designated writer)", "Hardware",
                 commandToString(kind));
        _hal.log(logBuf);
        return GATE_WRONG_WRITER;
    }

    // Last line of defence, evaluated against the real hardware.
    if (kind == CMD_UNLOCK_INNER || kind == CMD_UNLOCK_OUTER) {
        HardwareSnapshot snap;
        if (!_port.readSnapshot(snap)) return GATE_FAULT;
        if (StandardInterlock::wouldOpenBoth(snap.innerUnlocked, snap.outerUnlocked, kind)) {
            char logBuf[96];
            snprintf(logBuf, sizeof(logBuf), " %-8s : INTERLOCK: %s refused, opposite side is open", "Hardware",
                     commandToString(kind));
            _hal.log(logBuf);
            return GATE_INTERLOCK;
        }
    }

    waitForSpacing();

    bool ok = false;
    switch (kind) {
    case CMD_LOCK_INNER:      ok = _port.setLock(SIDE_INNER, false); break;
    case CMD_UNLOCK_INNER:    ok = _port.setLock(SIDE_INNER, true); break;
    case CMD_LOCK_OUTER:      ok = _port.setLock(SIDE_OUTER, false); break;
    case CMD_UNLOCK_OUTER:    ok = _port.setLock(SIDE_OUTER, true); break;
    case CMD_RFID_POWER_ON:   ok = _port.setRfidPower(true); break;
    case CMD_RFID_POWER_OFF:  ok = _port.setRfidPower(false); break;
    case CMD_RFID_FIELD_ON:   ok = _port.setRfidField(true); break;
    case CMD_RFID_FIELD_OFF:  ok = _port.setRfidField(false); break;
    case CMD_RFID_READ_START: ok = _port.setRfidReading(true, readCycles); break;
    case CMD_RFID_READ_STOP:  ok = _port.setRfidReading(false, 0); break;
    default:                  ok = false; break;
    }

    _lastWriteAt = _hal.getMillis();
    _hasWritten = true;
    _writeCount++;

    return ok ? GATE_APPLIED : GATE_FAULT;
}
