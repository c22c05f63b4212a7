/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      include/ControlTasks.h
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Worker threads that drive the clock-based entry points of the
 * ControlSessionManager: the heartbeat watchdog and the command executor.
 * =================================================================================
 */
#pragma once
#include <atomic>
#include <thread>

#include "ControlSession.h"

// Polls the session watchdog every watchdogPollMs.
class WatchdogTask {
public:
  WatchdogTask(IPlatformHAL &hal, ControlSessionManager &session);
  ~WatchdogTask();

  void start();
  void stop();
  uint32_t getExpiries() const { return _expiries; }

private:
  IPlatformHAL &_hal;
  ControlSessionManager &_session;
  std::atomic<bool> _running;
  std::atomic<uint32_t> _expiries;
  std::thread _thread;

  void run();
};

// Single consumer of the command queue. Only this thread writes hardware
// while a session is active.
class CommandExecutorTask {
public:
  explicit CommandExecutorTask(ControlSessionManager &session);
  ~CommandExecutorTask();

  void start();
  void stop();

private:
  ControlSessionManager &_session;
  std::atomic<bool> _running;
  std::thread _thread;

  void run();
};
