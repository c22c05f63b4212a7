/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      main_target.cpp
 * Description: Target daemon entry point. Owns the hardware and serves the
 *              control port.
 * =================================================================================
 */

#include <atomic>
#include <memory>
#include <utility>
#include <signal.h>
#include <stdio.h>

// --- Module Includes ---
#include "ArtifactCatalog.h"
#include "Config.h"
#include "ControlTasks.h"
#include "LinuxControlHAL.h"
#include "Logger.h"
#include "SettingsManager.h"
#include "SimulatedHardwarePort.h"
#include "SysfsHardwarePort.h"
#include "SystemdFallback.h"
#include "TargetControlService.h"

// --- Control Engine Includes ---
#include "BootWaitGate.h"
#include "ControlSession.h"
#include "StandardInterlock.h"
#include "TimeUtils.h"

static std::atomic<bool> g_stopRequested(false);

static void onSignal(int) { g_stopRequested = true; }

/**
 * Prints identity, build information and the effective configuration.
 */
void printFirmwareDiagnostics(const TargetSettings &s, const char *configPath) {
  LinuxControlHAL &hal = LinuxControlHAL::getInstance();
  char logBuf[128];

  hal.log(LOG_SEP_MAJOR);
  hal.log("                       TARGET IDENTITY                                    ");
  hal.log(LOG_SEP_MAJOR);

  // -------------------------------------------------------------------------
  // SECTION: IDENTITY
  // -------------------------------------------------------------------------
  hal.log("[ VERSION INFO ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Device Name", DEVICE_NAME);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Version", FLAPLINK_VERSION);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %u", "Protocol Version", (unsigned)FLAPLINK_PROTOCOL_VERSION);
  hal.log(logBuf);

  // -------------------------------------------------------------------------
  // SECTION: BUILD METADATA
  // -------------------------------------------------------------------------
  hal.log("");
  hal.log("[ BUILD DETAILS ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Date", __DATE__);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Build Time", __TIME__);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %ld", "C++ Standard", __cplusplus);
  hal.log(logBuf);

  // -------------------------------------------------------------------------
  // SECTION: CONFIGURATION
  // -------------------------------------------------------------------------
  hal.log("");
  hal.log("[ CONFIGURATION ]");

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Config File", configPath);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %u (max %u peers)", "Control Port", (unsigned)s.listenPort,
           s.maxConnections);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Local Service", s.serviceName);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Hardware",
           s.simulateHardware ? "SIMULATED" : s.gpioRoot);
  hal.log(logBuf);

  if (!s.simulateHardware) {
    snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "RFID Reader", s.rfidDevice);
    hal.log(logBuf);
  }

  char timeStr[48];
  TimeUtils::formatMillis(s.timings.bootWaitTimeoutMs, timeStr, sizeof(timeStr));
  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Boot Wait", timeStr);
  hal.log(logBuf);

  snprintf(logBuf, sizeof(logBuf), " %-25s : %s", "Database", s.databasePath);
  hal.log(logBuf);

  hal.log(LOG_SEP_MAJOR);
}

// =================================================================
// --- Core Application Setup & Loop ---
// =================================================================

int main(int argc, char **argv) {
  const char *configPath = (argc > 1) ? argv[1] : TARGET_CONFIG_PATH;
  LinuxControlHAL &hal = LinuxControlHAL::getInstance();

  // 1. Load Settings
  TargetSettings settings;
  SettingsManager::loadTargetSettings(configPath, settings);
  hal.configurePaths(settings.infoSignalPath, settings.bootMarkerPath);

  printFirmwareDiagnostics(settings, configPath);
  hal.printStartupDiagnostics("TARGET");
  processLogQueue();

  // 2. Initialize Hardware
  std::unique_ptr<IHardwarePort> port;
  if (settings.simulateHardware) {
    port = std::make_unique<SimulatedHardwarePort>(hal);
  } else {
    std::unique_ptr<SysfsHardwarePort> sysfs =
        std::make_unique<SysfsHardwarePort>(hal, settings.gpioRoot, settings.rfidDevice);
    if (!sysfs->initialize()) {
      hal.logKeyValue("System", "CRITICAL: Hardware init failed. Exiting.");
      processLogQueue();
      return 1;
    }
    port = std::move(sysfs);
  }

  // 3. Initialize Engine
  SystemdFallback fallback(hal, settings.serviceName);
  StandardInterlock rules(settings.timings.interlockMode);
  ControlSessionManager session(hal, *port, fallback, rules, settings.timings);
  ArtifactCatalog catalog(settings);
  TargetControlService service(hal, session, catalog, settings);
  session.setListener(&service);

  // 4. Boot Wait (hold the local service back if remote control was used)
  BootWaitGate bootWait;
  if (bootWait.begin(hal.getMillis(), hal.isBootMarkerPresent(), settings.timings.bootWaitTimeoutMs)) {
    hal.logKeyValue("System", "Remote control marker found. Holding local service.");
    session.holdLocalControl("boot-wait");
  }

  // 5. Start Tasks
  WatchdogTask watchdog(hal, session);
  CommandExecutorTask executor(session);
  executor.start();
  watchdog.start();

  std::string err;
  if (!service.start(err)) {
    hal.logKeyValue("System", ("CRITICAL: " + err).c_str());
    watchdog.stop();
    executor.stop();
    if (bootWait.isHolding()) session.resumeLocalControl();
    processLogQueue();
    return 1;
  }

  // 6. Diagnostics
  session.printStartupDiagnostics();
  hal.log(LOG_SEP_MAJOR);

  signal(SIGINT, onSignal);
  signal(SIGTERM, onSignal);
  signal(SIGPIPE, SIG_IGN);

  unsigned long lastEnforceAt = hal.getMillis();

  while (!g_stopRequested) {
    // 1. System Housekeeping
    processLogQueue();

    unsigned long now = hal.getMillis();

    // 2. Boot Wait
    if (bootWait.isHolding()) {
      BootWaitAction action = bootWait.tick(now, session.getState());
      if (action == BOOT_WAIT_RESUME_FALLBACK) {
        hal.logKeyValue("System", "Boot wait elapsed. Resuming local service.");
        session.resumeLocalControl();
      } else if (action == BOOT_WAIT_HANDED_OVER) {
        hal.logKeyValue("System", "Boot wait ended by remote claim.");
      }
    }

    // 3. Keep the local service stopped while a session is held
    if (TimeUtils::elapsedSince(lastEnforceAt, now) >= settings.timings.enforceStopIntervalMs) {
      lastEnforceAt = now;
      session.enforceFallbackStopped();
    }

    hal.sleepMs(50);
  }

  // --- Shutdown ---
  hal.logKeyValue("System", "Shutdown requested.");
  service.stop();
  session.forceRelease(RELEASE_SHUTDOWN);
  watchdog.stop();
  executor.stop();
  if (bootWait.isHolding()) session.resumeLocalControl();

  char byeBuf[64];
  snprintf(byeBuf, sizeof(byeBuf), "Watchdog expiries this run: %u", watchdog.getExpiries());
  hal.logKeyValue("System", byeBuf);
  hal.logKeyValue("System", "Bye.");
  processLogQueue();
  return 0;
}
