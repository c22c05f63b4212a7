/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      lib/ControlEngine/HardwareGate.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Single write path into the IHardwarePort.
 * - Accepts writes only from the currently designated writer.
 * - Refuses any write that would leave both locks unlocked.
 * - Keeps the minimum spacing between consecutive hardware commands.
 * =================================================================================
 */
#pragma once
#include <mutex>

#include "ControlContext.h"
#include "Types.h"

enum GateResult : uint8_t { GATE_APPLIED, GATE_WRONG_WRITER, GATE_INTERLOCK, GATE_FAULT };

class HardwareGate {
public:
    HardwareGate(IHardwarePort& port, IPlatformHAL& hal, uint32_t commandSpacingMs);

    void designateWriter(HardwareWriter writer);
    HardwareWriter getWriter() const;

    GateResult apply(HardwareWriter who, CommandKind kind, uint32_t readCycles);
    bool readSnapshot(HardwareSnapshot& out);

    uint32_t getWriteCount() const;

private:
    IHardwarePort& _port;
    IPlatformHAL& _hal;
    uint32_t _spacingMs;

    mutable std::mutex _mutex;
    HardwareWriter _writer;
    unsigned long _lastWriteAt;
    bool _hasWritten;
    uint32_t _writeCount;

    void waitForSpacing();
};
