/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      src/SystemdFallback.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 * =================================================================================
 */
#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <stdio.h>
#include <string.h>
#include <sys/wait.h>
#include <unistd.h>

#include "SystemdFallback.h"
#include "Types.h"

SystemdFallback::SystemdFallback(IPlatformHAL &hal, const char *serviceName, uint32_t timeoutMs)
    : _hal(hal), _serviceName(serviceName ? serviceName : ""), _timeoutMs(timeoutMs) {}

void SystemdFallback::logKeyValue(const char *key, const char *value) {
  char tempBuf[MAX_LOG_LENGTH];
  snprintf(tempBuf, sizeof(tempBuf), " %-8s : %s", key, value);
  _hal.log(tempBuf);
}

int SystemdFallback::runSystemctl(const char *verb, bool quiet) {
  pid_t pid = fork();
  if (pid < 0) {
    char logBuf[96];
    snprintf(logBuf, sizeof(logBuf), "fork failed: %s", strerror(errno));
    logKeyValue("Fallback", logBuf);
    return -1;
  }

  if (pid == 0) {
    setpgid(0, 0);
    int devnull = open("/dev/null", O_WRONLY);
    if (devnull >= 0) {
      dup2(devnull, STDOUT_FILENO);
      if (quiet) dup2(devnull, STDERR_FILENO);
      close(devnull);
    }
    execlp("systemctl", "systemctl", verb, _serviceName.c_str(), (char *)nullptr);
    _exit(127);
  }

  int status = 0;
  unsigned long started = _hal.getMillis();
  for (;;) {
    pid_t w = waitpid(pid, &status, WNOHANG);
    if (w == pid) break;
    if (w < 0 && errno != EINTR) return -1;

    if (_hal.getMillis() - started > _timeoutMs) {
      kill(-pid, SIGTERM);
      _hal.sleepMs(200);
      kill(-pid, SIGKILL);
      waitpid(pid, &status, 0);
      return 124;
    }
    _hal.sleepMs(20);
  }

  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return 1;
}

bool SystemdFallback::stop() {
  int rc = runSystemctl("stop", false);
  char logBuf[96];
  snprintf(logBuf, sizeof(logBuf), "systemctl stop %s -> %d", _serviceName.c_str(), rc);
  logKeyValue("Fallback", logBuf);
  return rc == 0;
}

bool SystemdFallback::start() {
  int rc = runSystemctl("start", false);
  char logBuf[96];
  snprintf(logBuf, sizeof(logBuf), "systemctl start %s -> %d", _serviceName.c_str(), rc);
  logKeyValue("Fallback", logBuf);
  return rc == 0;
}

bool SystemdFallback::isRunning() {
  // is-active exits 0 only for an active unit
  return runSystemctl("is-active", true) == 0;
}
