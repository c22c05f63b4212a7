/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      Types.cpp
 * =================================================================================
 */

#include <string.h>

#include "Types.h"

const char *stateToString(ControlState s) {
  switch (s) {
  case IDLE:
    return "IDLE";
  case CLAIMED:
    return "CLAIMED";
  case ACTIVE:
    return "ACTIVE";
  case RELEASING:
    return "RELEASING";
  default:
    return "IDLE";
  }
}

// Wire names. Order matches CommandKind.
static const char *const COMMAND_NAMES[] = {
    "LOCK_INNER",    "UNLOCK_INNER",   "LOCK_OUTER",    "UNLOCK_OUTER",     "RFID_POWER_ON",
    "RFID_POWER_OFF", "RFID_FIELD_ON", "RFID_FIELD_OFF", "RFID_READ_START", "RFID_READ_STOP",
};

const char *commandToString(CommandKind k) {
  if (k >= CMD_UNKNOWN) return "UNKNOWN";
  return COMMAND_NAMES[k];
}

CommandKind commandFromString(const char *s) {
  if (!s) return CMD_UNKNOWN;
  for (uint8_t i = 0; i < CMD_UNKNOWN; i++) {
    if (strcmp(s, COMMAND_NAMES[i]) == 0) return (CommandKind)i;
  }
  return CMD_UNKNOWN;
}

const char *rejectToString(RejectReason r) {
  switch (r) {
  case REJECT_NONE:
    return "None";
  case REJECT_NOT_ACTIVE:
    return "NotActive";
  case REJECT_AUTHORIZATION:
    return "Authorization";
  case REJECT_SEQUENCE:
    return "SequenceError";
  case REJECT_INTERLOCK:
    return "Interlock";
  case REJECT_HARDWARE_FAULT:
    return "HardwareFault";
  case REJECT_UNKNOWN_COMMAND:
    return "UnknownCommand";
  case REJECT_QUEUE_FULL:
    return "QueueFull";
  default:
    return "None";
  }
}

const char *releaseToString(ReleaseReason r) {
  switch (r) {
  case RELEASE_GRACEFUL:
    return "Graceful";
  case RELEASE_WATCHDOG_TIMEOUT:
    return "WatchdogTimeout";
  case RELEASE_CONNECTION_LOST:
    return "ConnectionLost";
  case RELEASE_PROTOCOL_ERROR:
    return "ProtocolError";
  case RELEASE_HARDWARE_FAULT:
    return "HardwareFault";
  case RELEASE_SHUTDOWN:
    return "Shutdown";
  default:
    return "Graceful";
  }
}

const char *claimToString(ClaimResult c) {
  switch (c) {
  case CLAIM_ACCEPTED:
    return "Accepted";
  case CLAIM_ALREADY_OWNED:
    return "AlreadyOwned";
  case CLAIM_FALLBACK_BUSY:
    return "FallbackBusy";
  case CLAIM_ABORTED:
    return "Aborted";
  default:
    return "Aborted";
  }
}

static const char *const ARTIFACT_NAMES[] = {"database", "config", "pictures", "models", "labelstudio"};

const char *artifactToString(ArtifactId a) {
  if (a >= ARTIFACT_COUNT) return "unknown";
  return ARTIFACT_NAMES[a];
}

ArtifactId artifactFromString(const char *s) {
  if (!s) return ARTIFACT_COUNT;
  for (uint8_t i = 0; i < ARTIFACT_COUNT; i++) {
    if (strcmp(s, ARTIFACT_NAMES[i]) == 0) return (ArtifactId)i;
  }
  return ARTIFACT_COUNT;
}

const char *syncStatusToString(SyncStatus s) {
  switch (s) {
  case SYNC_COMPLETED:
    return "COMPLETED";
  case SYNC_ALREADY_DONE:
    return "ALREADY_DONE";
  case SYNC_TRANSFER_FAILED:
    return "TRANSFER_FAILED";
  case SYNC_MARKER_FAILED:
    return "MARKER_FAILED";
  default:
    return "TRANSFER_FAILED";
  }
}
