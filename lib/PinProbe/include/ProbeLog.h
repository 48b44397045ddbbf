#pragma once

#include <atomic>
#include <stdint.h>

#include "ProbeConfig.h"

class ByteTransport;

enum class LogLevel : uint8_t {
  Off = 0,
  Error = 1,
  Warn = 2,
  Info = 3,
  Debug = 4,
  Trace = 5,
};

const char *logLevelName(LogLevel level);
// Accepts a level name ("warn") or its number ("2").
bool parseLogLevel(const char *text, LogLevel *out);

// Log lines go to the console only while a host holds the port open.
class ProbeLog {
 public:
  ProbeLog() : level_(static_cast<uint8_t>(PINPROBE_DEFAULT_LOG_LEVEL)), transport_(nullptr) {}

  void attach(ByteTransport *transport) { transport_.store(transport); }
  void setLevel(LogLevel level) { level_.store(static_cast<uint8_t>(level)); }
  LogLevel level() const { return static_cast<LogLevel>(level_.load()); }
  bool enabled(LogLevel level) const;

  void log(LogLevel level, const char *fmt, ...) __attribute__((format(printf, 3, 4)));

 private:
  std::atomic<uint8_t> level_;
  std::atomic<ByteTransport *> transport_;
};

ProbeLog &probeLog();

#define PINPROBE_LOGE(...) probeLog().log(LogLevel::Error, __VA_ARGS__)
#define PINPROBE_LOGW(...) probeLog().log(LogLevel::Warn, __VA_ARGS__)
#define PINPROBE_LOGI(...) probeLog().log(LogLevel::Info, __VA_ARGS__)
#define PINPROBE_LOGD(...) probeLog().log(LogLevel::Debug, __VA_ARGS__)
#define PINPROBE_LOGT(...) probeLog().log(LogLevel::Trace, __VA_ARGS__)
