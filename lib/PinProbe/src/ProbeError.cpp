#include "ProbeError.h"

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>

static void defaultFatalHandler(const char *message) {
  fprintf(stderr, "FATAL: %s\n", message);
}

static FatalHandler gFatalHandler = defaultFatalHandler;

const char *errorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::None:
      return "ok";
    case ErrorCode::Parse:
      return "argument parse";
    case ErrorCode::ParseBuffer:
      return "while parsing buffer";
    case ErrorCode::TooManyArgs:
      return "too many arguments";
    case ErrorCode::ArgTooLong:
      return "argument too long";
    case ErrorCode::MissingArg:
      return "missing argument";
    case ErrorCode::CmdNotFound:
      return "command not found";
    case ErrorCode::AliasNotFound:
      return "alias not found";
    case ErrorCode::GpioNotFound:
      return "gpio not found";
    case ErrorCode::PinAlreadyConfigured:
      return "pin already configured";
    case ErrorCode::PinNotConfigured:
      return "pin not configured";
    case ErrorCode::WouldBlock:
      return "would block";
    case ErrorCode::Disconnected:
      return "disconnected";
    case ErrorCode::BufferOverflow:
      return "buffer overflow";
    case ErrorCode::InvalidEndpoint:
      return "invalid endpoint";
    case ErrorCode::CmdExec:
      return "command failed";
    case ErrorCode::QueueFull:
      return "queue full";
  }
  return "unknown";
}

void ProbeError::clear() {
  code = ErrorCode::None;
  detail[0] = '\0';
}

bool ProbeError::set(ErrorCode c) {
  code = c;
  detail[0] = '\0';
  return false;
}

bool ProbeError::set(ErrorCode c, const char *fmt, ...) {
  code = c;
  va_list args;
  va_start(args, fmt);
  vsnprintf(detail, sizeof(detail), fmt, args);
  va_end(args);
  return false;
}

size_t ProbeError::format(char *out, size_t outLen) const {
  if (!out || outLen == 0) {
    return 0;
  }
  int n = 0;
  if (detail[0]) {
    n = snprintf(out, outLen, "%s: %s", errorCodeName(code), detail);
  } else {
    n = snprintf(out, outLen, "%s", errorCodeName(code));
  }
  if (n < 0) {
    out[0] = '\0';
    return 0;
  }
  return static_cast<size_t>(n) < outLen ? static_cast<size_t>(n) : outLen - 1;
}

void setFatalHandler(FatalHandler handler) {
  gFatalHandler = handler ? handler : defaultFatalHandler;
}

void probeFatal(const char *fmt, ...) {
  char message[96];
  va_list args;
  va_start(args, fmt);
  vsnprintf(message, sizeof(message), fmt, args);
  va_end(args);
  gFatalHandler(message);
  abort();
}
