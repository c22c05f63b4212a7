/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      Logger.h / Logger.cpp
 *
 * SPDX-License-Identifier: Apache-2.0
 *
 * Description:
 * Thread-safe logging system. Manages a ring buffer for storing the most recent
 * log lines in memory and a print queue drained to stderr by the main loop.
 * =================================================================================
 */
#ifndef LOGGER_H
#define LOGGER_H

#include "Types.h"

// =================================================================================
// SECTION: LOGGING CONSTANTS
// =================================================================================
#define LOG_SEP_MAJOR "=========================================================================="

// =================================================================================
// SECTION: CORE LOGGING FUNCTIONS
// =================================================================================
void logMessage(const char *message);
void processLogQueue();

// Copies the buffered history (oldest first) into 'out', one line per entry.
int copyLogHistory(char (*out)[MAX_LOG_LENGTH], int maxLines);

#endif
