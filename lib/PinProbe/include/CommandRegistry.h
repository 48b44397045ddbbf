#pragma once

#include <stddef.h>

#include "ByteTransport.h"
#include "CommandParser.h"
#include "ProbeConfig.h"
#include "ProbeError.h"

class Device;
struct Command;

typedef bool (*CommandHandler)(const Command &cmd, const ParsedCommand &args, Device &device,
                               ProbeError &err);

struct Command {
  const char *name;
  const char *desc;
  const char *help;
  CommandHandler handler;

  void printHelp(ByteTransport &out) const;
};

class CommandRegistry {
 public:
  CommandRegistry() = default;
  CommandRegistry(const CommandRegistry &) = delete;
  CommandRegistry &operator=(const CommandRegistry &) = delete;

  // Returns false and logs a warning once the table is full.
  bool registerCommand(const Command &cmd);
  bool get(const char *name, const Command **out, ProbeError &err) const;

  size_t size() const { return count_; }
  const Command &at(size_t index) const { return commands_[index]; }

 private:
  Command commands_[kMaxCommands];
  size_t count_ = 0;
};

// Turns one input line into a handler call. "help" is answered here.
class Dispatcher {
 public:
  explicit Dispatcher(const CommandRegistry &registry) : registry_(registry) {}

  bool execute(const char *line, Device &device, ProbeError &err);

 private:
  bool printHelp(const ParsedCommand &parsed, ByteTransport &out, ProbeError &err) const;

  const CommandRegistry &registry_;
};
