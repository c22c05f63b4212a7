#include "Logger.h"
#include "Types.h"

#include <mutex>
#include <stdio.h>
#include <string.h>

// --- Logging System ---
// Ring buffer for storing logs in memory.
static char logBuffer[LOG_BUFFER_SIZE][MAX_LOG_LENGTH];
static int logBufferIndex = 0;
static bool logBufferFull = false;

// Print queue (to keep stderr writes outside the mutex)
static char printQueue[SERIAL_QUEUE_SIZE][MAX_LOG_LENGTH];
static int printQueueHead = 0;
static int printQueueTail = 0;
static unsigned long droppedLines = 0;

static std::mutex logMutex;

/**
 * Thread-safe logging. NO I/O IN THIS FUNCTION.
 * Adds a message to the in-memory log buffer and pushes to the print queue.
 */
void logMessage(const char *message) {
  std::lock_guard<std::mutex> lock(logMutex);

  snprintf(logBuffer[logBufferIndex], MAX_LOG_LENGTH, "%s", message);
  logBufferIndex++;
  if (logBufferIndex >= LOG_BUFFER_SIZE) {
    logBufferIndex = 0;
    logBufferFull = true;
  }

  int nextHead = (printQueueHead + 1) % SERIAL_QUEUE_SIZE;
  if (nextHead != printQueueTail) {
    snprintf(printQueue[printQueueHead], MAX_LOG_LENGTH, "%s", message);
    printQueueHead = nextHead;
  } else {
    // Queue full, the line is still in the ring buffer
    droppedLines++;
  }
}

/**
 * Called in the main loop to drain the print queue to stderr.
 * Drains up to 20 messages per call.
 */
void processLogQueue() {
  int maxLinesToProcess = 20;

  while (maxLinesToProcess > 0) {
    char msgCopy[MAX_LOG_LENGTH];
    bool hasMessage = false;
    unsigned long dropped = 0;

    // 1. Quick lock to pop a message
    {
      std::lock_guard<std::mutex> lock(logMutex);
      if (printQueueHead != printQueueTail) {
        strncpy(msgCopy, printQueue[printQueueTail], MAX_LOG_LENGTH);
        msgCopy[MAX_LOG_LENGTH - 1] = '\0';
        printQueueTail = (printQueueTail + 1) % SERIAL_QUEUE_SIZE;
        hasMessage = true;
      }
      dropped = droppedLines;
      droppedLines = 0;
    }

    if (dropped > 0) {
      fprintf(stderr, " %-8s : %lu log lines dropped (print queue full)\n", "System", dropped);
    }

    // 2. Print OUTSIDE the lock
    if (!hasMessage) break;
    fprintf(stderr, "%s\n", msgCopy);
    maxLinesToProcess--;
  }
  fflush(stderr);
}

int copyLogHistory(char (*out)[MAX_LOG_LENGTH], int maxLines) {
  std::lock_guard<std::mutex> lock(logMutex);

  int count = logBufferFull ? LOG_BUFFER_SIZE : logBufferIndex;
  int start = logBufferFull ? logBufferIndex : 0;
  if (count > maxLines) {
    start = (start + (count - maxLines)) % LOG_BUFFER_SIZE;
    count = maxLines;
  }

  for (int i = 0; i < count; i++) {
    strncpy(out[i], logBuffer[(start + i) % LOG_BUFFER_SIZE], MAX_LOG_LENGTH);
    out[i][MAX_LOG_LENGTH - 1] = '\0';
  }
  return count;
}
