/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      lib/WireProtocol/WireTypes.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Message model of the control link.
 *
 * Frame layout (all integers big endian):
 *   u32 frame_len   length of everything after this field
 *   u16 header_len  length of the JSON header
 *   ... header      UTF-8 JSON object, always carries "type"
 *   ... body        optional binary payload (SYNC_DATA file bytes)
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <string>
#include <vector>

#include "Types.h"

#define FLAPLINK_PROTOCOL_VERSION 1
#define WIRE_MAX_FRAME_SIZE (16u * 1024u * 1024u)
#define WIRE_MAX_HEADER_SIZE 0xFFFFu
#define WIRE_FRAME_PREFIX 4
#define WIRE_HEADER_PREFIX 2

enum MessageType : uint8_t {
    MSG_HELLO,
    MSG_HELLO_ACK,
    MSG_CLAIM,
    MSG_CLAIM_OK,
    MSG_CLAIM_REJECTED,
    MSG_HEARTBEAT,
    MSG_HEARTBEAT_ACK,
    MSG_COMMAND,
    MSG_ACK,
    MSG_REJECTED,
    MSG_TELEMETRY,
    MSG_RELEASE,
    MSG_SYNC_REQUEST,
    MSG_SYNC_DATA,
    MSG_SYNC_DONE,
    MSG_SYNC_FAILED,
    MSG_UNKNOWN
};

// One raw frame as cut from the byte stream.
struct WireFrame {
    std::string header;
    std::vector<uint8_t> body;
};

/**
 * Decoded message. Only the fields of the given 'type' are meaningful:
 *   HELLO / HELLO_ACK   protocolVersion, endpoint
 *   CLAIM               endpoint
 *   CLAIM_OK            sessionId, controlTimeoutMs, heartbeatIntervalMs
 *   CLAIM_REJECTED      reason
 *   HEARTBEAT(_ACK)     sessionId, timestamp
 *   COMMAND             sessionId, sequence, command, readCycles
 *   ACK                 sessionId, sequence, command, snapshot + changedMask
 *   REJECTED            sessionId, sequence, command, reason
 *   TELEMETRY           sessionId, snapshot (changedMask = FIELD_ALL)
 *   RELEASE             sessionId, reason
 *   SYNC_REQUEST        sessionId, manifest
 *   SYNC_DATA           artifact, path, offset, final, checksum, body
 *   SYNC_DONE           files, bytes
 *   SYNC_FAILED         reason
 */
struct WireMessage {
    MessageType type;
    uint32_t protocolVersion;
    std::string endpoint;
    std::string sessionId;
    std::string reason;

    uint32_t controlTimeoutMs;
    uint32_t heartbeatIntervalMs;
    uint64_t timestamp;

    uint32_t sequence;
    CommandKind command;
    uint32_t readCycles;

    uint16_t changedMask;
    HardwareSnapshot snapshot;

    SyncManifest manifest;
    ArtifactId artifact;
    std::string path;
    uint64_t offset;
    bool final;
    uint32_t checksum;
    uint32_t files;
    uint64_t bytes;

    std::vector<uint8_t> body;

    WireMessage();
    explicit WireMessage(MessageType t);
};

extern const char* messageTypeToString(MessageType t);
extern MessageType messageTypeFromString(const char* s);
