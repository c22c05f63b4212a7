/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      src/SyncMarkerStore.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <ArduinoJson.h>
#include <string.h>

#include "LogicUtils.h"
#include "Storage.h"
#include "SyncMarkerStore.h"

bool FileSyncMarkerStore::load(SyncMarker &out) {
  memset(&out, 0, sizeof(out));

  std::string text, err;
  if (!readFileToString(_path, text, err)) return false;

  JsonDocument doc;
  if (deserializeJson(doc, text)) return false;

  out.synced = doc["synced"] | false;
  LogicUtils::copyString(out.targetHost, sizeof(out.targetHost), doc["target_host"] | "");
  out.syncedAtMs = doc["synced_at_ms"] | (uint64_t)0;

  JsonObjectConst artifacts = doc["artifacts"];
  for (int i = 0; i < ARTIFACT_COUNT; i++) {
    JsonObjectConst a = artifacts[artifactToString((ArtifactId)i)];
    if (a.isNull()) continue;
    out.included[i] = a["included"] | false;
    out.records[i].files = a["files"] | 0u;
    out.records[i].bytes = a["bytes"] | (uint64_t)0;
    out.records[i].checksum = a["checksum"] | 0u;
  }
  return out.synced;
}

bool FileSyncMarkerStore::save(const SyncMarker &marker, std::string &errorMsg) {
  JsonDocument doc;
  doc["synced"] = marker.synced;
  doc["target_host"] = marker.targetHost;
  doc["synced_at_ms"] = marker.syncedAtMs;

  JsonObject artifacts = doc["artifacts"].to<JsonObject>();
  for (int i = 0; i < ARTIFACT_COUNT; i++) {
    JsonObject a = artifacts[artifactToString((ArtifactId)i)].to<JsonObject>();
    a["included"] = marker.included[i];
    a["files"] = marker.records[i].files;
    a["bytes"] = marker.records[i].bytes;
    a["checksum"] = marker.records[i].checksum;
  }

  std::string out;
  serializeJsonPretty(doc, out);
  return writeFileAtomic(_path, out, errorMsg);
}

bool FileSyncMarkerStore::remove() { return removeFile(_path); }
