/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      lib/WireProtocol/WireCodec.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * JSON header codec for the control link (ArduinoJson v7).
 * - encode(): WireMessage -> complete frame bytes.
 * - decode(): WireFrame -> WireMessage, validating the fields each type needs.
 * Returns false and fills errorMsg on any violation (ProtocolError).
 * =================================================================================
 */
#pragma once
#include <ArduinoJson.h>
#include <string>
#include <vector>

#include "WireTypes.h"

class WireCodec {
public:
    static bool encode(const WireMessage& msg, std::vector<uint8_t>& outFrame, std::string& errorMsg);
    static bool decode(const WireFrame& frame, WireMessage& out, std::string& errorMsg);

    // Snapshot <-> JSON. 'mask' selects the fields written; read fills only
    // the fields present and reports them in the returned mask.
    static void writeSnapshot(JsonObject obj, const HardwareSnapshot& snap, uint16_t mask);
    static uint16_t readSnapshot(JsonObjectConst obj, HardwareSnapshot& snap);

    // Rejects absolute paths, ".." components and empty names.
    static bool isSafeRelativePath(const std::string& path);
};
