/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      Types.h
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <stddef.h>

// --- Enums ---
enum ControlState : uint8_t { IDLE, CLAIMED, ACTIVE, RELEASING };

enum CommandKind : uint8_t {
  CMD_LOCK_INNER,
  CMD_UNLOCK_INNER,
  CMD_LOCK_OUTER,
  CMD_UNLOCK_OUTER,
  CMD_RFID_POWER_ON,
  CMD_RFID_POWER_OFF,
  CMD_RFID_FIELD_ON,
  CMD_RFID_FIELD_OFF,
  CMD_RFID_READ_START,
  CMD_RFID_READ_STOP,
  CMD_UNKNOWN
};

enum LockSide : uint8_t { SIDE_INNER, SIDE_OUTER };
enum HardwareWriter : uint8_t { WRITER_NONE, WRITER_LOCAL, WRITER_SESSION };
enum InterlockMode : uint8_t { INTERLOCK_REJECT, INTERLOCK_CORRECT };

enum ClaimResult : uint8_t { CLAIM_ACCEPTED, CLAIM_ALREADY_OWNED, CLAIM_FALLBACK_BUSY, CLAIM_ABORTED };

enum RejectReason : uint8_t {
  REJECT_NONE,
  REJECT_NOT_ACTIVE,
  REJECT_AUTHORIZATION,
  REJECT_SEQUENCE,
  REJECT_INTERLOCK,
  REJECT_HARDWARE_FAULT,
  REJECT_UNKNOWN_COMMAND,
  REJECT_QUEUE_FULL
};

enum ReleaseReason : uint8_t {
  RELEASE_GRACEFUL,
  RELEASE_WATCHDOG_TIMEOUT,
  RELEASE_CONNECTION_LOST,
  RELEASE_PROTOCOL_ERROR,
  RELEASE_HARDWARE_FAULT,
  RELEASE_SHUTDOWN
};

enum ArtifactId : uint8_t {
  ARTIFACT_DATABASE,
  ARTIFACT_CONFIG,
  ARTIFACT_PICTURES,
  ARTIFACT_MODELS,
  ARTIFACT_LABELSTUDIO,
  ARTIFACT_COUNT
};

enum SyncStatus : uint8_t { SYNC_COMPLETED, SYNC_ALREADY_DONE, SYNC_TRANSFER_FAILED, SYNC_MARKER_FAILED };

// Bit positions used by snapshot deltas
enum SnapshotField : uint16_t {
  FIELD_INNER_LOCK = 0x0001,
  FIELD_OUTER_LOCK = 0x0002,
  FIELD_INNER_MOTION = 0x0004,
  FIELD_OUTER_MOTION = 0x0008,
  FIELD_RFID_POWER = 0x0010,
  FIELD_RFID_FIELD = 0x0020,
  FIELD_RFID_READING = 0x0040,
  FIELD_RFID_TAG = 0x0080,
  FIELD_ALL = 0x00FF
};

// --- Constants ---

// Identifiers
#define SESSION_ID_LENGTH 24
#define ENDPOINT_ID_LENGTH 64
#define RFID_TAG_LENGTH 32
#define TARGET_HOST_LENGTH 64

// Command executor
#define COMMAND_QUEUE_CAPACITY 16

// Logging
#define SERIAL_QUEUE_SIZE 50
#define LOG_BUFFER_SIZE 150
#define MAX_LOG_LENGTH 160

// --- Value Structs ---

struct HardwareSnapshot {
  uint32_t version;
  bool innerUnlocked;
  bool outerUnlocked;
  bool innerMotion;
  bool outerMotion;
  bool rfidPowered;
  bool rfidField;
  bool rfidReading;
  char rfidTag[RFID_TAG_LENGTH + 1];
  uint64_t rfidTimestampMs;
};

struct SnapshotDelta {
  uint16_t changedMask;
  HardwareSnapshot current;
};

struct CommandMessage {
  char sessionId[SESSION_ID_LENGTH + 1];
  uint32_t sequence;
  CommandKind kind;
  uint32_t readCycles; // CMD_RFID_READ_START only, 0 = until stopped
};

struct ControlSession {
  char sessionId[SESSION_ID_LENGTH + 1];
  char ownerEndpoint[ENDPOINT_ID_LENGTH + 1];
  ControlState state;
  unsigned long startedAt;
  unsigned long lastHeartbeatAt;
  uint32_t lastSequence;
  uint32_t generation;
};

// --- Configuration Structs ---

struct ControlTimings {
  uint32_t controlTimeoutMs;      // Watchdog T
  uint32_t settleDelayMs;         // Pause between fallback stop and ACTIVE
  uint32_t commandSpacingMs;      // Minimum gap between two hardware writes
  uint32_t watchdogPollMs;        // Watchdog task resolution
  uint32_t telemetryIntervalMs;   // Snapshot polling for TELEMETRY
  uint32_t enforceStopIntervalMs; // Fallback re-check while owned
  uint32_t bootWaitTimeoutMs;     // Fallback hold-off after reboot
  InterlockMode interlockMode;
};

struct LinkTimings {
  uint32_t heartbeatIntervalMs; // I
  uint32_t controlTimeoutMs;    // T, learned from CLAIM_OK
  uint32_t connectTimeoutMs;
  uint32_t handshakeTimeoutMs;
  uint32_t backoffInitialMs;
  uint32_t backoffCapMs;
  uint32_t backoffJitterPct;
};

struct SyncManifest {
  bool include[ARTIFACT_COUNT];
};

struct SyncArtifactRecord {
  uint32_t files;
  uint64_t bytes;
  uint32_t checksum;
};

struct SyncMarker {
  bool synced;
  char targetHost[TARGET_HOST_LENGTH + 1];
  uint64_t syncedAtMs;
  bool included[ARTIFACT_COUNT];
  SyncArtifactRecord records[ARTIFACT_COUNT];
};

extern const char *stateToString(ControlState s);
extern const char *commandToString(CommandKind k);
extern CommandKind commandFromString(const char *s);
extern const char *rejectToString(RejectReason r);
extern const char *releaseToString(ReleaseReason r);
extern const char *claimToString(ClaimResult c);
extern const char *artifactToString(ArtifactId a);
extern ArtifactId artifactFromString(const char *s);
extern const char *syncStatusToString(SyncStatus s);
