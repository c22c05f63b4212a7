/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      lib/ControlEngine/LogicUtils.h
 *
 * Description:
 * Pure logic utilities for session tokens, checksums and snapshot comparison.
 * Kept header-only so both the daemons and the native tests can use them.
 * =================================================================================
 */
#pragma once
#include <stdio.h>
#include <string.h>
#include <stdint.h>

#include "Types.h"

class LogicUtils {
public:
    static const uint32_t FNV_OFFSET = 2166136261u;
    static const uint32_t FNV_PRIME = 16777619u;

    /**
     * FNV-1a 32 bit, resumable: pass the previous result as 'hash' to continue
     * over the next chunk of the same stream.
     */
    static uint32_t fnv1a(const uint8_t* data, size_t len, uint32_t hash = FNV_OFFSET) {
        for (size_t i = 0; i < len; i++) {
            hash ^= data[i];
            hash *= FNV_PRIME;
        }
        return hash;
    }

    /**
     * Session token: "S" + 4 hex digits of the claim counter + "-" + 8 hex
     * digits of randomness. The counter keeps tokens unique per process.
     * @param outId Buffer of at least SESSION_ID_LENGTH + 1 chars.
     */
    static void formatSessionId(char* outId, size_t size, uint32_t counter, uint32_t entropy) {
        snprintf(outId, size, "S%04X-%08X", (unsigned)(counter & 0xFFFF), (unsigned)entropy);
    }

    /**
     * Bit mask of the SnapshotField values that differ between two snapshots.
     * The version counter is not compared.
     */
    static uint16_t diffSnapshots(const HardwareSnapshot& a, const HardwareSnapshot& b) {
        uint16_t mask = 0;
        if (a.innerUnlocked != b.innerUnlocked) mask |= FIELD_INNER_LOCK;
        if (a.outerUnlocked != b.outerUnlocked) mask |= FIELD_OUTER_LOCK;
        if (a.innerMotion != b.innerMotion) mask |= FIELD_INNER_MOTION;
        if (a.outerMotion != b.outerMotion) mask |= FIELD_OUTER_MOTION;
        if (a.rfidPowered != b.rfidPowered) mask |= FIELD_RFID_POWER;
        if (a.rfidField != b.rfidField) mask |= FIELD_RFID_FIELD;
        if (a.rfidReading != b.rfidReading) mask |= FIELD_RFID_READING;
        if (strcmp(a.rfidTag, b.rfidTag) != 0 || a.rfidTimestampMs != b.rfidTimestampMs) mask |= FIELD_RFID_TAG;
        return mask;
    }

    // Applies the fields selected by 'mask' from 'src' onto 'dst'.
    static void mergeSnapshot(HardwareSnapshot& dst, const HardwareSnapshot& src, uint16_t mask) {
        if (mask & FIELD_INNER_LOCK) dst.innerUnlocked = src.innerUnlocked;
        if (mask & FIELD_OUTER_LOCK) dst.outerUnlocked = src.outerUnlocked;
        if (mask & FIELD_INNER_MOTION) dst.innerMotion = src.innerMotion;
        if (mask & FIELD_OUTER_MOTION) dst.outerMotion = src.outerMotion;
        if (mask & FIELD_RFID_POWER) dst.rfidPowered = src.rfidPowered;
        if (mask & FIELD_RFID_FIELD) dst.rfidField = src.rfidField;
        if (mask & FIELD_RFID_READING) dst.rfidReading = src.rfidReading;
        if (mask & FIELD_RFID_TAG) {
            memcpy(dst.rfidTag, src.rfidTag, sizeof(dst.rfidTag));
            dst.rfidTimestampMs = src.rfidTimestampMs;
        }
        if (src.version > dst.version) dst.version = src.version;
    }

    static bool isLockCommand(CommandKind kind) {
        return kind == CMD_LOCK_INNER || kind == CMD_UNLOCK_INNER || kind == CMD_LOCK_OUTER || kind == CMD_UNLOCK_OUTER;
    }

    // Bounded copy that always terminates 'dst'.
    static void copyString(char* dst, size_t size, const char* src) {
        if (size == 0) return;
        if (!src) src = "";
        if (src == dst) {
            dst[size - 1] = '\0';
            return;
        }
        strncpy(dst, src, size - 1);
        dst[size - 1] = '\0';
    }
};
