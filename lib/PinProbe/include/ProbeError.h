#pragma once

#include <stddef.h>
#include <stdint.h>

enum class ErrorCode : uint8_t {
  None,
  Parse,
  ParseBuffer,
  TooManyArgs,
  ArgTooLong,
  MissingArg,
  CmdNotFound,
  AliasNotFound,
  GpioNotFound,
  PinAlreadyConfigured,
  PinNotConfigured,
  WouldBlock,
  Disconnected,
  BufferOverflow,
  InvalidEndpoint,
  CmdExec,
  QueueFull,
};

const char *errorCodeName(ErrorCode code);

// Error value filled by every fallible operation. The detail text is bounded and
// truncated, never allocated.
struct ProbeError {
  static const size_t kDetailLen = 48;

  ErrorCode code = ErrorCode::None;
  char detail[kDetailLen] = {0};

  bool ok() const { return code == ErrorCode::None; }
  void clear();
  // Both setters return false so handlers can `return err.set(...)`.
  bool set(ErrorCode c);
  bool set(ErrorCode c, const char *fmt, ...) __attribute__((format(printf, 3, 4)));

  // "<kind>: <detail>" or "<kind>" when there is no detail.
  size_t format(char *out, size_t outLen) const;
};

// Unrecoverable configuration error. Prints through the installed handler and never returns.
typedef void (*FatalHandler)(const char *message);

void setFatalHandler(FatalHandler handler);
[[noreturn]] void probeFatal(const char *fmt, ...) __attribute__((format(printf, 1, 2)));
