/*
 * =================================================================================
 * Project:   FlapLink - Pet-Door Remote Control Split
 * File:      lib/ControlEngine/TimeUtils.h
 *
 * Description:
 * Static helpers for the millisecond durations used throughout the control link
 * (timeouts, session lifetimes, backoff delays). Produces strings like
 * "1d 2h 3min 4s 500ms" for logs and diagnostics.
 * =================================================================================
 */
#pragma once
#include <stddef.h>
#include <stdio.h>

class TimeUtils {
public:
    /**
     * Formats milliseconds into a human-readable string (e.g., "2h 5min 3s 120ms").
     * Units with 0 values are omitted unless the total is 0ms.
     * @param totalMs The duration in milliseconds.
     * @param buffer  The destination buffer.
     * @param size    The size of the buffer.
     */
    static void formatMillis(unsigned long totalMs, char *buffer, size_t size) {
        if (size == 0) return;
        if (totalMs == 0) {
            snprintf(buffer, size, "0ms");
            return;
        }

        const unsigned long MS_SEC  = 1000;
        const unsigned long MS_MIN  = 60 * MS_SEC;
        const unsigned long MS_HOUR = 60 * MS_MIN;
        const unsigned long MS_DAY  = 24 * MS_HOUR;

        unsigned long rem = totalMs;

        unsigned long d = rem / MS_DAY;
        rem %= MS_DAY;

        unsigned long h = rem / MS_HOUR;
        rem %= MS_HOUR;

        unsigned long m = rem / MS_MIN;
        rem %= MS_MIN;

        unsigned long s = rem / MS_SEC;
        unsigned long ms = rem % MS_SEC;

        buffer[0] = '\0';
        size_t offset = 0;

        auto append = [&](unsigned long val, const char* suffix) {
            if (val > 0 && offset < size) {
                int n = snprintf(buffer + offset, size - offset, "%lu%s ", val, suffix);
                if (n > 0) offset += (size_t)n;
            }
        };

        append(d, "d");
        append(h, "h");
        append(m, "min");
        append(s, "s");
        append(ms, "ms");

        // Trim trailing space (or truncation remainder)
        if (offset >= size) offset = size - 1;
        if (offset > 0 && buffer[offset - 1] == ' ') {
            buffer[offset - 1] = '\0';
        }
    }

    /**
     * Elapsed time between two millisecond stamps, clamped at 0 when the clock
     * readings are out of order.
     */
    static unsigned long elapsedSince(unsigned long start, unsigned long now) {
        return (now >= start) ? (now - start) : 0;
    }
};
