#include "CommandParser.h"

#include <ctype.h>
#include <errno.h>
#include <limits.h>
#include <stdlib.h>
#include <string.h>

bool equalsIgnoreCase(const char *a, const char *b) {
  if (!a || !b) {
    return false;
  }
  while (*a && *b) {
    if (tolower(static_cast<unsigned char>(*a)) != tolower(static_cast<unsigned char>(*b))) {
      return false;
    }
    ++a;
    ++b;
  }
  return *a == *b;
}

static void lowercaseInPlace(char *s) {
  for (; *s; ++s) {
    *s = static_cast<char>(tolower(static_cast<unsigned char>(*s)));
  }
}

static bool copyBounded(char *dst, size_t maxLen, const char *src, size_t len, bool restoreSpaces) {
  if (len > maxLen) {
    return false;
  }
  for (size_t i = 0; i < len; ++i) {
    dst[i] = (restoreSpaces && src[i] == kQuotedSpace) ? ' ' : src[i];
  }
  dst[len] = '\0';
  return true;
}

ParsedCommand::ParsedCommand() { reset(); }

void ParsedCommand::reset() {
  strncpy(name, kDefaultCommand, sizeof(name) - 1);
  name[sizeof(name) - 1] = '\0';
  argc = 0;
  for (size_t i = 0; i < kMaxArgs; ++i) {
    args[i].param[0] = '\0';
    args[i].value[0] = '\0';
  }
}

const Argument *ParsedCommand::findArg(const char *param) const {
  for (size_t i = 0; i < argc; ++i) {
    if (equalsIgnoreCase(args[i].param, param)) {
      return &args[i];
    }
  }
  return nullptr;
}

bool ParsedCommand::hasParam(const char *param) const { return findArg(param) != nullptr; }

const char *ParsedCommand::getStr(const char *param, const char *fallback) const {
  const Argument *arg = findArg(param);
  return arg ? arg->value : fallback;
}

bool ParsedCommand::getU32(const char *param, uint32_t *out, ProbeError &err) const {
  const Argument *arg = findArg(param);
  if (!arg) {
    return err.set(ErrorCode::MissingArg, "<%s>", param);
  }
  const char *s = arg->value;
  if (!*s || s[0] == '-') {
    return err.set(ErrorCode::Parse, "%s", param);
  }
  errno = 0;
  char *end = nullptr;
  unsigned long long val = strtoull(s, &end, 0);
  if (!end || end == s || *end != '\0' || errno == ERANGE || val > 0xFFFFFFFFULL) {
    return err.set(ErrorCode::Parse, "%s", param);
  }
  *out = static_cast<uint32_t>(val);
  return true;
}

bool ParsedCommand::getI32(const char *param, int32_t *out, ProbeError &err) const {
  const Argument *arg = findArg(param);
  if (!arg) {
    return err.set(ErrorCode::MissingArg, "<%s>", param);
  }
  const char *s = arg->value;
  if (!*s) {
    return err.set(ErrorCode::Parse, "%s", param);
  }
  errno = 0;
  char *end = nullptr;
  long long val = strtoll(s, &end, 0);
  if (!end || end == s || *end != '\0' || errno == ERANGE || val < INT32_MIN ||
      val > INT32_MAX) {
    return err.set(ErrorCode::Parse, "%s", param);
  }
  *out = static_cast<int32_t>(val);
  return true;
}

bool ParsedCommand::getU16(const char *param, uint16_t *out, ProbeError &err) const {
  uint32_t val = 0;
  if (!getU32(param, &val, err)) {
    return false;
  }
  if (val > 0xFFFF) {
    return err.set(ErrorCode::Parse, "%s > 65535", param);
  }
  *out = static_cast<uint16_t>(val);
  return true;
}

bool ParsedCommand::getU8(const char *param, uint8_t *out, ProbeError &err) const {
  uint32_t val = 0;
  if (!getU32(param, &val, err)) {
    return false;
  }
  if (val > 0xFF) {
    return err.set(ErrorCode::Parse, "%s > 255", param);
  }
  *out = static_cast<uint8_t>(val);
  return true;
}

bool ParsedCommand::getFloat(const char *param, float *out, ProbeError &err) const {
  const Argument *arg = findArg(param);
  if (!arg) {
    return err.set(ErrorCode::MissingArg, "<%s>", param);
  }
  const char *s = arg->value;
  if (!*s) {
    return err.set(ErrorCode::Parse, "%s", param);
  }
  errno = 0;
  char *end = nullptr;
  float val = strtof(s, &end);
  if (!end || end == s || *end != '\0' || errno == ERANGE) {
    return err.set(ErrorCode::Parse, "%s", param);
  }
  *out = val;
  return true;
}

bool ParsedCommand::getBool(const char *param, bool *out, ProbeError &err) const {
  const Argument *arg = findArg(param);
  if (!arg) {
    return err.set(ErrorCode::MissingArg, "<%s>", param);
  }
  const char *s = arg->value;
  // A bare flag counts as set.
  if (!*s || equalsIgnoreCase(s, "true") || equalsIgnoreCase(s, "on") ||
      equalsIgnoreCase(s, "yes") || strcmp(s, "1") == 0) {
    *out = true;
    return true;
  }
  if (equalsIgnoreCase(s, "false") || equalsIgnoreCase(s, "off") ||
      equalsIgnoreCase(s, "no") || strcmp(s, "0") == 0) {
    *out = false;
    return true;
  }
  return err.set(ErrorCode::Parse, "%s", param);
}

bool optionalArg(bool found, ProbeError &err) {
  if (found) {
    return true;
  }
  if (err.code == ErrorCode::MissingArg) {
    err.clear();
    return true;
  }
  return false;
}

// Stage 1: strip quotes, resolve escapes and protect quoted spaces so the
// whitespace split keeps quoted values whole.
static bool normalizeLine(const char *line, char *out, size_t outCap, ProbeError &err) {
  size_t used = 0;
  bool inQuotes = false;
  bool escaped = false;
  for (const char *p = line; *p; ++p) {
    char c = *p;
    if (escaped) {
      escaped = false;
    } else if (c == '"') {
      inQuotes = !inQuotes;
      continue;
    } else if (inQuotes && c == kEscapeChar) {
      escaped = true;
      continue;
    }
    if (inQuotes && c == ' ') {
      c = kQuotedSpace;
    }
    if (used + 1 >= outCap) {
      return err.set(ErrorCode::ParseBuffer, "line longer than %u bytes",
                     static_cast<unsigned>(outCap - 1));
    }
    out[used++] = c;
  }
  out[used] = '\0';
  if (escaped) {
    return err.set(ErrorCode::Parse, "dangling escape");
  }
  if (inQuotes) {
    return err.set(ErrorCode::Parse, "unmatched quotes");
  }
  return true;
}

static char *nextToken(char **cursor) {
  char *p = *cursor;
  while (*p && isspace(static_cast<unsigned char>(*p))) {
    ++p;
  }
  if (!*p) {
    *cursor = p;
    return nullptr;
  }
  char *start = p;
  while (*p && !isspace(static_cast<unsigned char>(*p))) {
    ++p;
  }
  if (*p) {
    *p = '\0';
    ++p;
  }
  *cursor = p;
  return start;
}

static bool parseInto(const char *line, ParsedCommand &out, ProbeError &err) {
  char work[kLineBufferSize + 1];
  if (!normalizeLine(line, work, sizeof(work), err)) {
    return false;
  }

  char *cursor = work;
  char *token = nextToken(&cursor);
  if (!token) {
    return true;
  }
  if (!copyBounded(out.name, kMaxCmdNameLength, token, strlen(token), true)) {
    return err.set(ErrorCode::ArgTooLong, "command name");
  }
  lowercaseInPlace(out.name);

  while ((token = nextToken(&cursor)) != nullptr) {
    const size_t tokenLen = strlen(token);
    if (token[0] == '=' || token[tokenLen - 1] == '=') {
      return err.set(ErrorCode::Parse, "\"=\" delimiter spacing");
    }
    if (out.argc >= kMaxArgs) {
      return err.set(ErrorCode::TooManyArgs, "max %u", static_cast<unsigned>(kMaxArgs));
    }
    Argument &arg = out.args[out.argc];
    const char *eq = strchr(token, '=');
    const size_t paramLen = eq ? static_cast<size_t>(eq - token) : tokenLen;
    if (!copyBounded(arg.param, kMaxParamLength, token, paramLen, true)) {
      return err.set(ErrorCode::ArgTooLong, "parameter");
    }
    lowercaseInPlace(arg.param);
    const char *value = eq ? eq + 1 : "";
    if (!copyBounded(arg.value, kMaxValueLength, value, strlen(value), true)) {
      return err.set(ErrorCode::ArgTooLong, "value of %s", arg.param);
    }
    out.argc++;
  }
  return true;
}

bool parseCommand(const char *line, ParsedCommand &out, ProbeError &err) {
  out.reset();
  if (!line) {
    return true;
  }
  if (!parseInto(line, out, err)) {
    out.reset();
    return false;
  }
  return true;
}
