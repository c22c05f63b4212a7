/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      include/Config.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Central configuration file. Defines GPIO line numbers, file locations,
 * protocol constants, default settings and safety limits.
 * =================================================================================
 */
#pragma once
#include "AppTypes.h"

// --- Device Name String ---
#define DEVICE_NAME "FlapLink"
#define FLAPLINK_VERSION "1.0.0"

// =================================================================================
// SECTION: LINK & FILES
// =================================================================================

#define DEFAULT_CONTROL_PORT 8888
#define TARGET_CONFIG_PATH "/etc/flaplink/target.json"
#define REMOTE_CONFIG_PATH "/etc/flaplink/remote.json"

#define SYNC_CHUNK_SIZE (1024u * 1024u)
#define HANDSHAKE_TIMEOUT_MS 5000
#define RECEIVE_SLICE_MS 500
#define MIN_STALE_LINK_MS 6000
#define STALE_LINK_MARGIN_MS 3000

// =================================================================================
// SECTION: HARDWARE LINES
// =================================================================================

// sysfs GPIO numbers of the flap controller board
#define GPIO_LOCK_OUTSIDE 524
#define GPIO_LOCK_INSIDE 525
#define GPIO_RFID_FIELD 529
#define GPIO_RFID_POWER 515
#define GPIO_PIR_OUTSIDE 536
#define GPIO_PIR_INSIDE 535 // Active Low
#define GPIO_PIR_OUTSIDE_POWER 517
#define GPIO_PIR_INSIDE_POWER 516

#define RFID_TAG_HEX_LENGTH 16

// =================================================================================
// SECTION: SAFETY LIMITS
// =================================================================================

#define MIN_CONTROL_TIMEOUT_MS 3000
#define MAX_CONTROL_TIMEOUT_MS 120000
#define MIN_HEARTBEAT_INTERVAL_MS 1000
#define MIN_BOOT_WAIT_MS 5000
#define MAX_BOOT_WAIT_MS 600000
#define MAX_COMMAND_SPACING_MS 5000

// =================================================================================
// SECTION: DEFAULTS
// =================================================================================

static const TargetSettings DEFAULT_TARGET_DEFS = {
    DEFAULT_CONTROL_PORT, // listenPort
    4,                    // maxConnections
    {
        10000,            // controlTimeoutMs (T)
        1000,             // settleDelayMs
        1000,             // commandSpacingMs
        500,              // watchdogPollMs
        100,              // telemetryIntervalMs
        5000,             // enforceStopIntervalMs
        30000,            // bootWaitTimeoutMs
        INTERLOCK_REJECT  // interlockMode
    },
    "kittyhack",                              // serviceName
    "/run/flaplink/remote_control.json",      // infoSignalPath
    "/var/lib/flaplink/remote_used.json",     // bootMarkerPath
    false,                                    // simulateHardware
    "/sys/class/gpio",                        // gpioRoot
    "/dev/serial0",                           // rfidDevice
    "/root/kittyhack/kittyhack.db",           // databasePath
    "/root/kittyhack/config.ini",             // configPath
    "/root/pictures",                         // picturesDir
    "/root/kittyhack/models",                 // modelsDir
    "/root/labelstudio"                       // labelstudioDir
};

static const RemoteSettings DEFAULT_REMOTE_DEFS = {
    "",                   // targetHost (required)
    DEFAULT_CONTROL_PORT, // targetPort
    "remote",             // endpointId
    {
        3333,             // heartbeatIntervalMs (I = max(1s, T/3))
        10000,            // controlTimeoutMs (T)
        5000,             // connectTimeoutMs
        5000,             // handshakeTimeoutMs
        1000,             // backoffInitialMs
        30000,            // backoffCapMs
        20                // backoffJitterPct
    },
    true,                                            // syncOnFirstConnect
    {{true, true, true, true, false}},               // manifest (labelstudio optional)
    "/var/lib/flaplink",                             // localRoot
    "/var/lib/flaplink/kittyhack.db.remote_synced"   // markerPath
};
