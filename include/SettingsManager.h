/*
 * =================================================================================
 * File:      include/SettingsManager.h
 * Description:
 * Central controller for Device Configuration.
 * - Loads the target / remote JSON configuration files.
 * - Validates inputs against safety limits.
 * =================================================================================
 */
#pragma once
#include <stdint.h>
#include <string>

#include "AppTypes.h"

class SettingsManager {
public:
  // --- File Loading ---
  // 'out' always ends up valid: a missing or malformed file keeps the
  // defaults. Returns true only when the file was read and applied.
  static bool loadTargetSettings(const char *path, TargetSettings &out);
  static bool loadRemoteSettings(const char *path, RemoteSettings &out);

  // --- Parsing (JSON text) ---
  static bool parseTargetSettings(const std::string &json, TargetSettings &out, std::string &errorMsg);
  static bool parseRemoteSettings(const std::string &json, RemoteSettings &out, std::string &errorMsg);

  // --- Cross-field Rules ---
  static void applyTargetLimits(TargetSettings &s);
  static void applyRemoteLimits(RemoteSettings &s);

  static bool parseInterlockMode(const char *text, InterlockMode &out);
  static const char *interlockModeToString(InterlockMode mode);

  // Clamps 'value' into [min, max] and logs when it had to.
  static uint32_t validateAndClamp(uint32_t value, uint32_t min, uint32_t max, const char *label);

private:
  static void log(const char *key, const char *value);
};
