/*
 * =================================================================================
 * File:      src/SettingsManager.cpp
 * Description: Implementation of configuration loading and validation.
 * =================================================================================
 */
#include <ArduinoJson.h>
#include <stdio.h>
#include <string.h>

#include "Config.h"
#include "LinuxControlHAL.h" // For logging
#include "LogicUtils.h"
#include "SettingsManager.h"
#include "Storage.h"

// --- Safety Limits ---
static const uint32_t ABS_MAX_CONNECTIONS = 16;
static const uint32_t ABS_MIN_TELEMETRY_MS = 20;
static const uint32_t ABS_MAX_TELEMETRY_MS = 5000;
static const uint32_t ABS_MIN_ENFORCE_MS = 1000;
static const uint32_t ABS_MAX_ENFORCE_MS = 60000;
static const uint32_t ABS_MIN_BACKOFF_MS = 100;
static const uint32_t ABS_MAX_BACKOFF_MS = 600000;

// Helper for logging via HAL
void SettingsManager::log(const char *key, const char *val) { LinuxControlHAL::getInstance().logKeyValue(key, val); }

uint32_t SettingsManager::validateAndClamp(uint32_t value, uint32_t min, uint32_t max, const char *label) {
  uint32_t clamped = value;
  if (clamped < min) clamped = min;
  if (clamped > max) clamped = max;

  if (clamped != value) {
    char logBuf[96];
    snprintf(logBuf, sizeof(logBuf), "%s %u out of range, clamped to %u", label, value, clamped);
    log("Settings", logBuf);
  }
  return clamped;
}

bool SettingsManager::parseInterlockMode(const char *text, InterlockMode &out) {
  if (!text) return false;
  if (strcmp(text, "reject") == 0) {
    out = INTERLOCK_REJECT;
    return true;
  }
  if (strcmp(text, "correct") == 0) {
    out = INTERLOCK_CORRECT;
    return true;
  }
  return false;
}

const char *SettingsManager::interlockModeToString(InterlockMode mode) {
  return mode == INTERLOCK_CORRECT ? "correct" : "reject";
}

// =================================================================================
// SECTION: TARGET
// =================================================================================

void SettingsManager::applyTargetLimits(TargetSettings &s) {
  ControlTimings &t = s.timings;

  s.maxConnections = validateAndClamp(s.maxConnections, 1, ABS_MAX_CONNECTIONS, "max_connections");
  t.controlTimeoutMs =
      validateAndClamp(t.controlTimeoutMs, MIN_CONTROL_TIMEOUT_MS, MAX_CONTROL_TIMEOUT_MS, "control_timeout_ms");

  // The hand-over must finish well inside one watchdog period
  t.settleDelayMs = validateAndClamp(t.settleDelayMs, 0, t.controlTimeoutMs / 2, "settle_delay_ms");
  t.commandSpacingMs = validateAndClamp(t.commandSpacingMs, 0, MAX_COMMAND_SPACING_MS, "command_spacing_ms");
  t.watchdogPollMs = validateAndClamp(t.watchdogPollMs, 50, t.controlTimeoutMs / 4, "watchdog_poll_ms");
  t.telemetryIntervalMs =
      validateAndClamp(t.telemetryIntervalMs, ABS_MIN_TELEMETRY_MS, ABS_MAX_TELEMETRY_MS, "telemetry_interval_ms");
  t.enforceStopIntervalMs =
      validateAndClamp(t.enforceStopIntervalMs, ABS_MIN_ENFORCE_MS, ABS_MAX_ENFORCE_MS, "enforce_stop_interval_ms");
  t.bootWaitTimeoutMs =
      validateAndClamp(t.bootWaitTimeoutMs, MIN_BOOT_WAIT_MS, MAX_BOOT_WAIT_MS, "boot_wait_timeout_ms");
}

bool SettingsManager::parseTargetSettings(const std::string &json, TargetSettings &out, std::string &errorMsg) {
  out = DEFAULT_TARGET_DEFS;

  JsonDocument doc;
  DeserializationError err = deserializeJson(doc, json);
  if (err) {
    errorMsg = std::string("Malformed JSON: ") + err.c_str();
    return false;
  }
  if (!doc.is<JsonObjectConst>()) {
    errorMsg = "Top level must be an object";
    return false;
  }

  ControlTimings &t = out.timings;
  uint32_t port = doc["listen_port"] | (uint32_t)out.listenPort;
  out.listenPort = (uint16_t)validateAndClamp(port, 1, 65535, "listen_port");
  out.maxConnections = doc["max_connections"] | out.maxConnections;

  t.controlTimeoutMs = doc["control_timeout_ms"] | t.controlTimeoutMs;
  t.settleDelayMs = doc["settle_delay_ms"] | t.settleDelayMs;
  t.commandSpacingMs = doc["command_spacing_ms"] | t.commandSpacingMs;
  t.watchdogPollMs = doc["watchdog_poll_ms"] | t.watchdogPollMs;
  t.telemetryIntervalMs = doc["telemetry_interval_ms"] | t.telemetryIntervalMs;
  t.enforceStopIntervalMs = doc["enforce_stop_interval_ms"] | t.enforceStopIntervalMs;
  t.bootWaitTimeoutMs = doc["boot_wait_timeout_ms"] | t.bootWaitTimeoutMs;

  const char *mode = doc["interlock_mode"] | (const char *)nullptr;
  if (mode && !parseInterlockMode(mode, t.interlockMode)) {
    char logBuf[96];
    snprintf(logBuf, sizeof(logBuf), "Unknown interlock_mode '%s', keeping '%s'", mode,
             interlockModeToString(t.interlockMode));
    log("Settings", logBuf);
  }

  LogicUtils::copyString(out.serviceName, sizeof(out.serviceName), doc["service_name"] | (const char *)out.serviceName);
  LogicUtils::copyString(out.infoSignalPath, sizeof(out.infoSignalPath), doc["info_signal_path"] | (const char *)out.infoSignalPath);
  LogicUtils::copyString(out.bootMarkerPath, sizeof(out.bootMarkerPath), doc["boot_marker_path"] | (const char *)out.bootMarkerPath);

  out.simulateHardware = doc["simulate_hardware"] | out.simulateHardware;
  LogicUtils::copyString(out.gpioRoot, sizeof(out.gpioRoot), doc["gpio_root"] | (const char *)out.gpioRoot);
  LogicUtils::copyString(out.rfidDevice, sizeof(out.rfidDevice), doc["rfid_device"] | (const char *)out.rfidDevice);

  LogicUtils::copyString(out.databasePath, sizeof(out.databasePath), doc["database_path"] | (const char *)out.databasePath);
  LogicUtils::copyString(out.configPath, sizeof(out.configPath), doc["config_path"] | (const char *)out.configPath);
  LogicUtils::copyString(out.picturesDir, sizeof(out.picturesDir), doc["pictures_dir"] | (const char *)out.picturesDir);
  LogicUtils::copyString(out.modelsDir, sizeof(out.modelsDir), doc["models_dir"] | (const char *)out.modelsDir);
  LogicUtils::copyString(out.labelstudioDir, sizeof(out.labelstudioDir), doc["labelstudio_dir"] | (const char *)out.labelstudioDir);

  applyTargetLimits(out);
  return true;
}

bool SettingsManager::loadTargetSettings(const char *path, TargetSettings &out) {
  out = DEFAULT_TARGET_DEFS;

  if (!fileExists(path)) {
    log("Settings", "No target config file. Using defaults.");
    return false;
  }

  std::string text, err;
  if (!readFileToString(path, text, err) || !parseTargetSettings(text, out, err)) {
    log("Settings", ("Target config ignored: " + err).c_str());
    out = DEFAULT_TARGET_DEFS;
    return false;
  }

  log("Settings", (std::string("Loaded ") + path).c_str());
  return true;
}

// =================================================================================
// SECTION: REMOTE
// =================================================================================

void SettingsManager::applyRemoteLimits(RemoteSettings &s) {
  LinkTimings &l = s.link;

  s.targetPort = (uint16_t)validateAndClamp(s.targetPort, 1, 65535, "target_port");
  l.controlTimeoutMs =
      validateAndClamp(l.controlTimeoutMs, MIN_CONTROL_TIMEOUT_MS, MAX_CONTROL_TIMEOUT_MS, "control_timeout_ms");

  // Heartbeats must arrive several times per timeout period
  if (l.heartbeatIntervalMs >= l.controlTimeoutMs) {
    uint32_t forced = l.controlTimeoutMs / 3;
    if (forced < MIN_HEARTBEAT_INTERVAL_MS) forced = MIN_HEARTBEAT_INTERVAL_MS;

    char logBuf[96];
    snprintf(logBuf, sizeof(logBuf), "heartbeat_interval_ms %u >= timeout, forced to %u", l.heartbeatIntervalMs,
             forced);
    log("Settings", logBuf);
    l.heartbeatIntervalMs = forced;
  }
  l.heartbeatIntervalMs =
      validateAndClamp(l.heartbeatIntervalMs, MIN_HEARTBEAT_INTERVAL_MS, l.controlTimeoutMs, "heartbeat_interval_ms");

  l.backoffInitialMs = validateAndClamp(l.backoffInitialMs, ABS_MIN_BACKOFF_MS, ABS_MAX_BACKOFF_MS, "backoff_initial_ms");
  l.backoffCapMs = validateAndClamp(l.backoffCapMs, l.backoffInitialMs, ABS_MAX_BACKOFF_MS, "backoff_cap_ms");
  l.backoffJitterPct = validateAndClamp(l.backoffJitterPct, 0, 100, "backoff_jitter_pct");
}

bool SettingsManager::parseRemoteSettings(const std::string &json, RemoteSettings &out, std::string &errorMsg) {
  out = DEFAULT_REMOTE_DEFS;

  JsonDocument doc;
  DeserializationError err = deserializeJson(doc, json);
  if (err) {
    errorMsg = std::string("Malformed JSON: ") + err.c_str();
    return false;
  }
  if (!doc.is<JsonObjectConst>()) {
    errorMsg = "Top level must be an object";
    return false;
  }

  LinkTimings &l = out.link;
  LogicUtils::copyString(out.targetHost, sizeof(out.targetHost), doc["target_host"] | (const char *)out.targetHost);
  uint32_t port = doc["target_port"] | (uint32_t)out.targetPort;
  out.targetPort = (uint16_t)validateAndClamp(port, 1, 65535, "target_port");
  LogicUtils::copyString(out.endpointId, sizeof(out.endpointId), doc["endpoint_id"] | (const char *)out.endpointId);

  l.heartbeatIntervalMs = doc["heartbeat_interval_ms"] | l.heartbeatIntervalMs;
  l.controlTimeoutMs = doc["control_timeout_ms"] | l.controlTimeoutMs;
  l.connectTimeoutMs = doc["connect_timeout_ms"] | l.connectTimeoutMs;
  l.handshakeTimeoutMs = doc["handshake_timeout_ms"] | l.handshakeTimeoutMs;
  l.backoffInitialMs = doc["backoff_initial_ms"] | l.backoffInitialMs;
  l.backoffCapMs = doc["backoff_cap_ms"] | l.backoffCapMs;
  l.backoffJitterPct = doc["backoff_jitter_pct"] | l.backoffJitterPct;

  out.syncOnFirstConnect = doc["sync_on_first_connect"] | out.syncOnFirstConnect;
  static const char *SYNC_KEYS[ARTIFACT_COUNT] = {"sync_database", "sync_config", "sync_pictures", "sync_models",
                                                  "sync_labelstudio"};
  for (int i = 0; i < ARTIFACT_COUNT; i++) {
    out.manifest.include[i] = doc[SYNC_KEYS[i]] | out.manifest.include[i];
  }

  LogicUtils::copyString(out.localRoot, sizeof(out.localRoot), doc["local_root"] | (const char *)out.localRoot);
  LogicUtils::copyString(out.markerPath, sizeof(out.markerPath), doc["marker_path"] | (const char *)out.markerPath);

  applyRemoteLimits(out);
  return true;
}

bool SettingsManager::loadRemoteSettings(const char *path, RemoteSettings &out) {
  out = DEFAULT_REMOTE_DEFS;

  if (!fileExists(path)) {
    log("Settings", "No remote config file. Using defaults.");
    return false;
  }

  std::string text, err;
  if (!readFileToString(path, text, err) || !parseRemoteSettings(text, out, err)) {
    log("Settings", ("Remote config ignored: " + err).c_str());
    out = DEFAULT_REMOTE_DEFS;
    return false;
  }

  log("Settings", (std::string("Loaded ") + path).c_str());
  return true;
}
