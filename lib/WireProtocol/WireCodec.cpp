/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      lib/WireProtocol/WireCodec.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <string.h>

#include "FrameReader.h"
#include "LogicUtils.h"
#include "WireCodec.h"

// =================================================================================
// SECTION: NAME TABLES
// =================================================================================

static const char* const MESSAGE_NAMES[] = {
    "HELLO", "HELLO_ACK", "CLAIM", "CLAIM_OK", "CLAIM_REJECTED", "HEARTBEAT",
    "HEARTBEAT_ACK", "COMMAND", "ACK", "REJECTED", "TELEMETRY", "RELEASE",
    "SYNC_REQUEST", "SYNC_DATA", "SYNC_DONE", "SYNC_FAILED",
};

const char* messageTypeToString(MessageType t) {
    if (t >= MSG_UNKNOWN) return "UNKNOWN";
    return MESSAGE_NAMES[t];
}

MessageType messageTypeFromString(const char* s) {
    if (!s) return MSG_UNKNOWN;
    for (int i = 0; i < (int)MSG_UNKNOWN; i++) {
        if (strcmp(s, MESSAGE_NAMES[i]) == 0) return (MessageType)i;
    }
    return MSG_UNKNOWN;
}

WireMessage::WireMessage() : WireMessage(MSG_UNKNOWN) {}

WireMessage::WireMessage(MessageType t)
    : type(t),
      protocolVersion(0),
      controlTimeoutMs(0),
      heartbeatIntervalMs(0),
      timestamp(0),
      sequence(0),
      command(CMD_UNKNOWN),
      readCycles(0),
      changedMask(0),
      artifact(ARTIFACT_COUNT),
      offset(0),
      final(false),
      checksum(0),
      files(0),
      bytes(0) {
    memset(&snapshot, 0, sizeof(snapshot));
    memset(&manifest, 0, sizeof(manifest));
}

// =================================================================================
// SECTION: SNAPSHOT FIELDS
// =================================================================================

void WireCodec::writeSnapshot(JsonObject obj, const HardwareSnapshot& snap, uint16_t mask) {
    obj["version"] = snap.version;
    if (mask & FIELD_INNER_LOCK) obj["inner_unlocked"] = snap.innerUnlocked;
    if (mask & FIELD_OUTER_LOCK) obj["outer_unlocked"] = snap.outerUnlocked;
    if (mask & FIELD_INNER_MOTION) obj["inner_motion"] = snap.innerMotion;
    if (mask & FIELD_OUTER_MOTION) obj["outer_motion"] = snap.outerMotion;
    if (mask & FIELD_RFID_POWER) obj["rfid_power"] = snap.rfidPowered;
    if (mask & FIELD_RFID_FIELD) obj["rfid_field"] = snap.rfidField;
    if (mask & FIELD_RFID_READING) obj["rfid_reading"] = snap.rfidReading;
    if (mask & FIELD_RFID_TAG) {
        obj["rfid_tag"] = snap.rfidTag;
        obj["rfid_ts"] = snap.rfidTimestampMs;
    }
}

uint16_t WireCodec::readSnapshot(JsonObjectConst obj, HardwareSnapshot& snap) {
    uint16_t mask = 0;
    snap.version = obj["version"] | snap.version;

    if (obj["inner_unlocked"].is<bool>()) {
        snap.innerUnlocked = obj["inner_unlocked"];
        mask |= FIELD_INNER_LOCK;
    }
    if (obj["outer_unlocked"].is<bool>()) {
        snap.outerUnlocked = obj["outer_unlocked"];
        mask |= FIELD_OUTER_LOCK;
    }
    if (obj["inner_motion"].is<bool>()) {
        snap.innerMotion = obj["inner_motion"];
        mask |= FIELD_INNER_MOTION;
    }
    if (obj["outer_motion"].is<bool>()) {
        snap.outerMotion = obj["outer_motion"];
        mask |= FIELD_OUTER_MOTION;
    }
    if (obj["rfid_power"].is<bool>()) {
        snap.rfidPowered = obj["rfid_power"];
        mask |= FIELD_RFID_POWER;
    }
    if (obj["rfid_field"].is<bool>()) {
        snap.rfidField = obj["rfid_field"];
        mask |= FIELD_RFID_FIELD;
    }
    if (obj["rfid_reading"].is<bool>()) {
        snap.rfidReading = obj["rfid_reading"];
        mask |= FIELD_RFID_READING;
    }
    if (obj["rfid_tag"].is<const char*>()) {
        LogicUtils::copyString(snap.rfidTag, sizeof(snap.rfidTag), obj["rfid_tag"].as<const char*>());
        snap.rfidTimestampMs = obj["rfid_ts"] | (uint64_t)0;
        mask |= FIELD_RFID_TAG;
    }
    return mask;
}

bool WireCodec::isSafeRelativePath(const std::string& path) {
    if (path.empty() || path[0] == '/') return false;

    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        std::string part = path.substr(start, end - start);
        if (part.empty() || part == "." || part == "..") return false;
        start = end + 1;
    }
    return true;
}

// =================================================================================
// SECTION: ENCODER
// =================================================================================

bool WireCodec::encode(const WireMessage& msg, std::vector<uint8_t>& outFrame, std::string& errorMsg) {
    if (msg.type >= MSG_UNKNOWN) {
        errorMsg = "Cannot encode unknown message type";
        return false;
    }

    JsonDocument doc;
    doc["type"] = messageTypeToString(msg.type);
    if (!msg.sessionId.empty()) doc["session_id"] = msg.sessionId;

    switch (msg.type) {
    case MSG_HELLO:
    case MSG_HELLO_ACK:
        doc["version"] = msg.protocolVersion;
        doc["endpoint"] = msg.endpoint;
        break;

    case MSG_CLAIM:
        doc["endpoint"] = msg.endpoint;
        break;

    case MSG_CLAIM_OK:
        doc["timeout_ms"] = msg.controlTimeoutMs;
        doc["heartbeat_interval_ms"] = msg.heartbeatIntervalMs;
        break;

    case MSG_CLAIM_REJECTED:
    case MSG_RELEASE:
    case MSG_SYNC_FAILED:
        doc["reason"] = msg.reason;
        break;

    case MSG_HEARTBEAT:
    case MSG_HEARTBEAT_ACK:
        doc["ts"] = msg.timestamp;
        break;

    case MSG_COMMAND:
        doc["seq"] = msg.sequence;
        doc["command"] = commandToString(msg.command);
        if (msg.command == CMD_RFID_READ_START) doc["read_cycles"] = msg.readCycles;
        break;

    case MSG_ACK:
        doc["seq"] = msg.sequence;
        doc["command"] = commandToString(msg.command);
        // Only the fields the command changed
        writeSnapshot(doc["delta"].to<JsonObject>(), msg.snapshot, msg.changedMask);
        break;

    case MSG_REJECTED:
        doc["seq"] = msg.sequence;
        doc["command"] = commandToString(msg.command);
        doc["reason"] = msg.reason;
        break;

    case MSG_TELEMETRY:
        writeSnapshot(doc["snapshot"].to<JsonObject>(), msg.snapshot, FIELD_ALL);
        break;

    case MSG_SYNC_REQUEST: {
        JsonArray arr = doc["artifacts"].to<JsonArray>();
        for (int i = 0; i < ARTIFACT_COUNT; i++) {
            if (msg.manifest.include[i]) arr.add(artifactToString((ArtifactId)i));
        }
        break;
    }

    case MSG_SYNC_DATA:
        doc["artifact"] = artifactToString(msg.artifact);
        doc["path"] = msg.path;
        doc["offset"] = msg.offset;
        doc["final"] = msg.final;
        if (msg.final) doc["checksum"] = msg.checksum;
        break;

    case MSG_SYNC_DONE:
        doc["files"] = msg.files;
        doc["bytes"] = msg.bytes;
        break;

    default:
        break;
    }

    std::string header;
    serializeJson(doc, header);

    if (header.size() > WIRE_MAX_HEADER_SIZE) {
        errorMsg = "Header too large";
        return false;
    }
    if (WIRE_HEADER_PREFIX + header.size() + msg.body.size() > WIRE_MAX_FRAME_SIZE) {
        errorMsg = "Frame too large";
        return false;
    }

    FrameReader::writeFrame(header, msg.body.data(), msg.body.size(), outFrame);
    return true;
}

// =================================================================================
// SECTION: DECODER
// =================================================================================

static bool requireSession(JsonDocument& doc, WireMessage& out, std::string& errorMsg) {
    const char* sid = doc["session_id"] | "";
    if (sid[0] == '\0') {
        errorMsg = std::string(messageTypeToString(out.type)) + " without session_id";
        return false;
    }
    out.sessionId = sid;
    return true;
}

bool WireCodec::decode(const WireFrame& frame, WireMessage& out, std::string& errorMsg) {
    JsonDocument doc;
    DeserializationError err = deserializeJson(doc, frame.header);
    if (err) {
        errorMsg = std::string("Malformed header: ") + err.c_str();
        return false;
    }
    if (!doc.is<JsonObject>()) {
        errorMsg = "Header is not a JSON object";
        return false;
    }

    const char* typeStr = doc["type"] | "";
    MessageType type = messageTypeFromString(typeStr);
    if (type == MSG_UNKNOWN) {
        errorMsg = std::string("Unknown message type: '") + typeStr + "'";
        return false;
    }

    out = WireMessage(type);
    out.sessionId = doc["session_id"] | "";

    switch (type) {
    case MSG_HELLO:
    case MSG_HELLO_ACK:
        if (!doc["version"].is<uint32_t>()) {
            errorMsg = "HELLO without version";
            return false;
        }
        out.protocolVersion = doc["version"];
        out.endpoint = doc["endpoint"] | "";
        break;

    case MSG_CLAIM:
        out.endpoint = doc["endpoint"] | "";
        break;

    case MSG_CLAIM_OK:
        if (!requireSession(doc, out, errorMsg)) return false;
        out.controlTimeoutMs = doc["timeout_ms"] | 0u;
        out.heartbeatIntervalMs = doc["heartbeat_interval_ms"] | 0u;
        break;

    case MSG_CLAIM_REJECTED:
    case MSG_RELEASE:
    case MSG_SYNC_FAILED:
        out.reason = doc["reason"] | "";
        break;

    case MSG_HEARTBEAT:
        if (!requireSession(doc, out, errorMsg)) return false;
        out.timestamp = doc["ts"] | (uint64_t)0;
        break;

    case MSG_HEARTBEAT_ACK:
        out.timestamp = doc["ts"] | (uint64_t)0;
        break;

    case MSG_COMMAND:
    case MSG_ACK:
    case MSG_REJECTED:
        if (!doc["seq"].is<uint32_t>()) {
            errorMsg = std::string(typeStr) + " without seq";
            return false;
        }
        out.sequence = doc["seq"];
        // Unknown command names are answered with REJECTED, not dropped
        out.command = commandFromString(doc["command"] | "");
        out.readCycles = doc["read_cycles"] | 0u;
        out.reason = doc["reason"] | "";
        if (type == MSG_ACK && doc["delta"].is<JsonObjectConst>()) {
            out.changedMask = readSnapshot(doc["delta"].as<JsonObjectConst>(), out.snapshot);
        }
        break;

    case MSG_TELEMETRY:
        if (!doc["snapshot"].is<JsonObjectConst>()) {
            errorMsg = "TELEMETRY without snapshot";
            return false;
        }
        out.changedMask = readSnapshot(doc["snapshot"].as<JsonObjectConst>(), out.snapshot);
        break;

    case MSG_SYNC_REQUEST:
        if (doc["artifacts"].is<JsonArrayConst>()) {
            for (JsonVariantConst v : doc["artifacts"].as<JsonArrayConst>()) {
                ArtifactId id = artifactFromString(v | "");
                if (id == ARTIFACT_COUNT) {
                    errorMsg = std::string("Unknown artifact: ") + (v | "");
                    return false;
                }
                out.manifest.include[id] = true;
            }
        }
        break;

    case MSG_SYNC_DATA:
        out.artifact = artifactFromString(doc["artifact"] | "");
        if (out.artifact == ARTIFACT_COUNT) {
            errorMsg = "SYNC_DATA for unknown artifact";
            return false;
        }
        out.path = doc["path"] | "";
        if (!isSafeRelativePath(out.path)) {
            errorMsg = "SYNC_DATA with unsafe path '" + out.path + "'";
            return false;
        }
        out.offset = doc["offset"] | (uint64_t)0;
        out.final = doc["final"] | false;
        out.checksum = doc["checksum"] | 0u;
        out.body = frame.body;
        break;

    case MSG_SYNC_DONE:
        out.files = doc["files"] | 0u;
        out.bytes = doc["bytes"] | (uint64_t)0;
        break;

    default:
        break;
    }

    return true;
}
