#include "ProbeLog.h"

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>

#include "ByteTransport.h"
#include "CommandParser.h"

static const char *const kLevelNames[] = {"off", "error", "warn", "info", "debug", "trace"};
static const char *const kLevelTags[] = {"[OFF]   ", "[ERROR] ", "[WARN]  ",
                                         "[INFO]  ", "[DEBUG] ", "[TRACE] "};
static const uint8_t kLevelCount = sizeof(kLevelNames) / sizeof(kLevelNames[0]);

const char *logLevelName(LogLevel level) {
  const uint8_t idx = static_cast<uint8_t>(level);
  return idx < kLevelCount ? kLevelNames[idx] : "unknown";
}

bool parseLogLevel(const char *text, LogLevel *out) {
  if (!text || !*text) {
    return false;
  }
  for (uint8_t i = 0; i < kLevelCount; ++i) {
    if (equalsIgnoreCase(text, kLevelNames[i])) {
      *out = static_cast<LogLevel>(i);
      return true;
    }
  }
  char *end = nullptr;
  const unsigned long num = strtoul(text, &end, 10);
  if (end && *end == '\0' && num < kLevelCount) {
    *out = static_cast<LogLevel>(num);
    return true;
  }
  return false;
}

bool ProbeLog::enabled(LogLevel level) const {
  return level != LogLevel::Off && static_cast<uint8_t>(level) <= level_.load();
}

void ProbeLog::log(LogLevel level, const char *fmt, ...) {
  ByteTransport *transport = transport_.load();
  if (!transport || !enabled(level) || !transport->isConnected()) {
    return;
  }
  char line[kWriteBufferSize];
  const char *tag = kLevelTags[static_cast<uint8_t>(level)];
  const size_t tagLen = strlen(tag);
  memcpy(line, tag, tagLen);
  va_list args;
  va_start(args, fmt);
  vsnprintf(line + tagLen, sizeof(line) - tagLen, fmt, args);
  va_end(args);
  transport->println(line);
}

ProbeLog &probeLog() {
  static ProbeLog instance;
  return instance;
}
