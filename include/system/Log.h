#pragma once

#include <cstdarg>
#include <cstdio>

#ifdef ARDUINO
#include <Arduino.h>
#endif

#ifndef OWLINK_VERBOSE_LOGGING
#define OWLINK_VERBOSE_LOGGING 0
#endif

namespace owlink::system {

constexpr bool kVerboseLogging = OWLINK_VERBOSE_LOGGING != 0;
constexpr size_t kLogLineBytes = 192;

inline void vlogLine(const char* tag, const char* fmt, va_list args) {
#ifdef ARDUINO
    char line[kLogLineBytes];
    std::vsnprintf(line, sizeof(line), fmt, args);
    Serial.printf("[%s] %s\n", tag, line);
#else
    (void)tag;
    (void)fmt;
    (void)args;
#endif
}

// Tagged serial line: logLine("AUTH", "strategy %s failed", name) prints
// "[AUTH] strategy ... failed". Host builds print nothing.
inline void logLine(const char* tag, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    vlogLine(tag, fmt, args);
    va_end(args);
}

// Per-notification and per-tick detail, only with OWLINK_VERBOSE_LOGGING.
inline void traceLine(const char* tag, const char* fmt, ...) {
    if (!kVerboseLogging) {
        return;
    }
    va_list args;
    va_start(args, fmt);
    vlogLine(tag, fmt, args);
    va_end(args);
}

}  // namespace owlink::system
