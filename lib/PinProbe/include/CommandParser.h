#pragma once

#include <stddef.h>
#include <stdint.h>

#include "ProbeConfig.h"
#include "ProbeError.h"

struct Argument {
  char param[kMaxParamLength + 1];
  char value[kMaxValueLength + 1];
};

struct ParsedCommand {
  char name[kMaxCmdNameLength + 1];
  Argument args[kMaxArgs];
  size_t argc;

  ParsedCommand();
  void reset();

  // First argument whose parameter matches (case-insensitive), or nullptr.
  const Argument *findArg(const char *param) const;
  bool hasParam(const char *param) const;
  const char *getStr(const char *param, const char *fallback) const;

  // Typed lookups fail with MissingArg when absent and Parse when malformed.
  bool getU32(const char *param, uint32_t *out, ProbeError &err) const;
  bool getI32(const char *param, int32_t *out, ProbeError &err) const;
  bool getU16(const char *param, uint16_t *out, ProbeError &err) const;
  bool getU8(const char *param, uint8_t *out, ProbeError &err) const;
  bool getFloat(const char *param, float *out, ProbeError &err) const;
  bool getBool(const char *param, bool *out, ProbeError &err) const;
};

static const char kDefaultCommand[] = "help";
static const char kQuotedSpace = '\x1E';
static const char kEscapeChar = '\\';

bool parseCommand(const char *line, ParsedCommand &out, ProbeError &err);

// Wraps a typed lookup for an optional argument: MissingArg keeps the caller's
// default and clears err, any other failure is passed through.
bool optionalArg(bool found, ProbeError &err);

bool equalsIgnoreCase(const char *a, const char *b);
