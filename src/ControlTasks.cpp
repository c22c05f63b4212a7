/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      src/ControlTasks.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include "ControlTasks.h"

#define EXECUTOR_WAIT_MS 200

// =================================================================================
// SECTION: WATCHDOG TASK
// =================================================================================

WatchdogTask::WatchdogTask(IPlatformHAL &hal, ControlSessionManager &session)
    : _hal(hal), _session(session), _running(false), _expiries(0) {}

WatchdogTask::~WatchdogTask() { stop(); }

void WatchdogTask::start() {
  if (_running.exchange(true)) return;
  _thread = std::thread(&WatchdogTask::run, this);
}

void WatchdogTask::stop() {
  _running = false;
  if (_thread.joinable()) _thread.join();
}

void WatchdogTask::run() {
  uint32_t pollMs = _session.getTimings().watchdogPollMs;
  if (pollMs == 0) pollMs = 100;

  while (_running) {
    _hal.sleepMs(pollMs);
    if (_session.checkWatchdog()) _expiries++;
  }
}

// =================================================================================
// SECTION: COMMAND EXECUTOR TASK
// =================================================================================

CommandExecutorTask::CommandExecutorTask(ControlSessionManager &session) : _session(session), _running(false) {}

CommandExecutorTask::~CommandExecutorTask() { stop(); }

void CommandExecutorTask::start() {
  if (_running.exchange(true)) return;
  _thread = std::thread(&CommandExecutorTask::run, this);
}

void CommandExecutorTask::stop() {
  if (!_running.exchange(false)) return;
  _session.stopExecutor();
  if (_thread.joinable()) _thread.join();
}

void CommandExecutorTask::run() {
  while (_running) {
    _session.executeNext(EXECUTOR_WAIT_MS);
  }
}
