/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      main_remote.cpp
 * Description: Remote client entry point with an operator console on stdin.
 * =================================================================================
 */

#include <poll.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

// --- Module Includes ---
#include "ArtifactWriter.h"
#include "Config.h"
#include "LinuxControlHAL.h"
#include "Logger.h"
#include "RemoteControlClient.h"
#include "SettingsManager.h"
#include "SyncMarkerStore.h"

// --- Control Engine Includes ---
#include "InitialSync.h"
#include "LogicUtils.h"

static volatile sig_atomic_t g_stopRequested = 0;

static void onSignal(int) { g_stopRequested = 1; }

// Console verbs that map 1:1 onto hardware commands
static const struct {
  const char *verb;
  CommandKind kind;
} CONSOLE_COMMANDS[] = {
    {"unlock_inner", CMD_UNLOCK_INNER}, {"lock_inner", CMD_LOCK_INNER},   {"unlock_outer", CMD_UNLOCK_OUTER},
    {"lock_outer", CMD_LOCK_OUTER},     {"rfid_on", CMD_RFID_POWER_ON},   {"rfid_off", CMD_RFID_POWER_OFF},
    {"field_on", CMD_RFID_FIELD_ON},    {"field_off", CMD_RFID_FIELD_OFF}, {"read_stop", CMD_RFID_READ_STOP},
};

// Prints what the link reports to the operator.
class ConsoleConsumer : public IRemoteConsumer {
public:
  void onTelemetry(const HardwareSnapshot &s) override {
    char logBuf[160];
    snprintf(logBuf, sizeof(logBuf), "v%u inner=%s outer=%s motion=%d/%d rfid=%s%s%s tag=%s", s.version,
             s.innerUnlocked ? "OPEN" : "locked", s.outerUnlocked ? "OPEN" : "locked", s.innerMotion, s.outerMotion,
             s.rfidPowered ? "pwr" : "off", s.rfidField ? "+field" : "", s.rfidReading ? "+reading" : "",
             s.rfidTag[0] ? s.rfidTag : "-");
    LinuxControlHAL::getInstance().logKeyValue("Telem", logBuf);
  }

  void onCommandResult(uint32_t sequence, CommandKind kind, bool accepted, const char *reason,
                       const HardwareSnapshot &) override {
    printf("#%u %s -> %s%s%s\n", sequence, commandToString(kind), accepted ? "OK" : "REJECTED",
           accepted ? "" : ": ", accepted ? "" : reason);
    fflush(stdout);
  }

  void onLinkStatus(LinkStatus status, const char *detail) override {
    printf("[link] %s %s\n", linkStatusToString(status), detail);
    fflush(stdout);
  }
};

/**
 * Prints identity, build information and the effective link configuration.
 */
void printFirmwareDiagnostics(const RemoteSettings &s, const char *configPath) {
  LinuxControlHAL &hal = LinuxControlHAL::getInstance();
  char logBuf[160];

  hal.log(LOG_SEP_MAJOR);
  hal.log("                       REMOTE IDENTITY                                    ");
  hal.log(LOG_SEP_MAJOR);

  hal.log("[ VERSION INFO ]");
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s %s", "Client", DEVICE_NAME, FLAPLINK_VERSION);
  hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s %s", "Build", __DATE__, __TIME__);
  hal.log(logBuf);

  hal.log("");
  hal.log("[ LINK ]");
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Config File", configPath);
  hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s:%u", "Target", s.targetHost, (unsigned)s.targetPort);
  hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Endpoint Id", s.endpointId);
  hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %u ms / %u ms", "Heartbeat / Timeout", s.link.heartbeatIntervalMs,
           s.link.controlTimeoutMs);
  hal.log(logBuf);
  snprintf(logBuf, sizeof(logBuf), " %-25s : %u ms .. %u ms (+%u%%)", "Backoff", s.link.backoffInitialMs,
           s.link.backoffCapMs, s.link.backoffJitterPct);
  hal.log(logBuf);

  hal.log("");
  hal.log("[ INITIAL SYNC ]");
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "On First Connect", s.syncOnFirstConnect ? "YES" : "NO");
  hal.log(logBuf);
  for (int i = 0; i < ARTIFACT_COUNT; i++) {
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", artifactToString((ArtifactId)i),
             s.manifest.include[i] ? "included" : "skipped");
    hal.log(logBuf);
  }
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Local Root", s.localRoot);
  hal.log(logBuf);

  hal.log(LOG_SEP_MAJOR);
}

static void printStatus(RemoteControlClient &client, InitialSync &sync) {
  HardwareSnapshot snap;
  bool have = client.getLastSnapshot(snap);

  printf(" %-25s : %s\n", "Link", linkStatusToString(client.getLinkStatus()));
  printf(" %-25s : %s\n", "Session", client.getSessionId().c_str());
  printf(" %-25s : %s\n", "Telemetry", client.isTelemetryStale() ? "STALE" : "live");
  printf(" %-25s : %u\n", "Reconnect Attempts", client.getReconnectAttempts());
  printf(" %-25s : %u\n", "Pending Commands", (unsigned)client.getPendingCount());
  if (sync.isSynced()) {
    const SyncMarker &m = sync.getLastMarker();
    printf(" %-25s : %s\n", "Initial Sync", m.targetHost[0] ? m.targetHost : "done");
  } else {
    printf(" %-25s : %s\n", "Initial Sync", "pending");
  }
  if (have) {
    printf(" %-25s : %s / %s\n", "Inner / Outer Lock", snap.innerUnlocked ? "UNLOCKED" : "locked",
           snap.outerUnlocked ? "UNLOCKED" : "locked");
    printf(" %-25s : %d / %d\n", "Inner / Outer Motion", snap.innerMotion, snap.outerMotion);
    printf(" %-25s : power=%d field=%d reading=%d\n", "RFID", snap.rfidPowered, snap.rfidField, snap.rfidReading);
    printf(" %-25s : %s\n", "Last Tag", snap.rfidTag[0] ? snap.rfidTag : "-");
  }
  fflush(stdout);
}

static void printHistory() {
  static char lines[LOG_BUFFER_SIZE][MAX_LOG_LENGTH];
  int n = copyLogHistory(lines, LOG_BUFFER_SIZE);
  for (int i = 0; i < n; i++) printf("%s\n", lines[i]);
  fflush(stdout);
}

// Returns false on "quit".
static bool handleConsoleLine(RemoteControlClient &client, InitialSync &sync, char *line) {
  char *verb = strtok(line, " \t\r\n");
  if (!verb) return true;
  char *arg = strtok(nullptr, " \t\r\n");

  std::string err;
  for (const auto &c : CONSOLE_COMMANDS) {
    if (strcmp(verb, c.verb) == 0) {
      if (!client.sendCommand(c.kind, 0, err)) printf("! %s\n", err.c_str());
      fflush(stdout);
      return true;
    }
  }

  if (strcmp(verb, "read_start") == 0) {
    uint32_t cycles = arg ? (uint32_t)strtoul(arg, nullptr, 10) : 0;
    if (!client.sendCommand(CMD_RFID_READ_START, cycles, err)) printf("! %s\n", err.c_str());
  } else if (strcmp(verb, "disconnect") == 0) {
    client.requestDisconnect();
  } else if (strcmp(verb, "reconnect") == 0) {
    client.requestReconnect();
  } else if (strcmp(verb, "status") == 0) {
    printStatus(client, sync);
  } else if (strcmp(verb, "history") == 0) {
    printHistory();
  } else if (strcmp(verb, "quit") == 0 || strcmp(verb, "exit") == 0) {
    return false;
  } else {
    printf("? commands: unlock_inner lock_inner unlock_outer lock_outer rfid_on rfid_off field_on field_off\n"
           "           read_start [cycles] read_stop disconnect reconnect status history quit\n");
  }
  fflush(stdout);
  return true;
}

// =================================================================
// --- Core Application Setup & Loop ---
// =================================================================

int main(int argc, char **argv) {
  const char *configPath = (argc > 1) ? argv[1] : REMOTE_CONFIG_PATH;
  LinuxControlHAL &hal = LinuxControlHAL::getInstance();

  // 1. Load Settings
  RemoteSettings settings;
  SettingsManager::loadRemoteSettings(configPath, settings);
  if (argc > 2) LogicUtils::copyString(settings.targetHost, sizeof(settings.targetHost), argv[2]);

  printFirmwareDiagnostics(settings, configPath);
  processLogQueue();

  if (settings.targetHost[0] == '\0') {
    hal.logKeyValue("System", "CRITICAL: target_host not configured.");
    processLogQueue();
    fprintf(stderr, "usage: %s [config.json] [target-host]\n", argv[0]);
    return 2;
  }

  // 2. Sync & Link
  FileSyncMarkerStore markers(settings.markerPath);
  InitialSync initialSync(hal, markers);
  ArtifactWriter writer(settings.localRoot);
  ConsoleConsumer consumer;

  RemoteControlClient client(hal, settings, &initialSync, &writer);
  client.setConsumer(&consumer);

  signal(SIGINT, onSignal);
  signal(SIGTERM, onSignal);
  signal(SIGPIPE, SIG_IGN);

  client.start();

  // 3. Console Loop
  char line[256];
  bool consoleOpen = true;
  while (!g_stopRequested) {
    processLogQueue();

    // Without a console (stdin closed) keep running until signalled
    if (!consoleOpen) {
      hal.sleepMs(100);
      continue;
    }

    struct pollfd pfd;
    pfd.fd = STDIN_FILENO;
    pfd.events = POLLIN;
    pfd.revents = 0;
    if (poll(&pfd, 1, 100) <= 0) continue;

    if (!fgets(line, sizeof(line), stdin)) {
      consoleOpen = false;
      continue;
    }
    if (!handleConsoleLine(client, initialSync, line)) break;
  }

  hal.logKeyValue("System", "Shutting down client.");
  client.stop();
  processLogQueue();
  return 0;
}
