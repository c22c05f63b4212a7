/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      include/AppTypes.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Configuration structs of the two executables (target daemon and remote
 * client). Defaults live in Config.h, loading in SettingsManager.
 * =================================================================================
 */
#pragma once
#include "Types.h"

#define PATH_LENGTH 256
#define SERVICE_NAME_LENGTH 64

struct TargetSettings {
  uint16_t listenPort;
  uint32_t maxConnections; // Concurrent TCP peers (one may own the session)
  ControlTimings timings;

  // --- Local service & info page ---
  char serviceName[SERVICE_NAME_LENGTH];
  char infoSignalPath[PATH_LENGTH];
  char bootMarkerPath[PATH_LENGTH];

  // --- Hardware ---
  bool simulateHardware;
  char gpioRoot[PATH_LENGTH];
  char rfidDevice[PATH_LENGTH];

  // --- Sync artifacts ---
  char databasePath[PATH_LENGTH];
  char configPath[PATH_LENGTH];
  char picturesDir[PATH_LENGTH];
  char modelsDir[PATH_LENGTH];
  char labelstudioDir[PATH_LENGTH];
};

struct RemoteSettings {
  char targetHost[TARGET_HOST_LENGTH + 1];
  uint16_t targetPort;
  char endpointId[ENDPOINT_ID_LENGTH + 1];
  LinkTimings link;

  // --- Initial sync ---
  bool syncOnFirstConnect;
  SyncManifest manifest;
  char localRoot[PATH_LENGTH];
  char markerPath[PATH_LENGTH];
};
