#include "CommandRegistry.h"

#include "Device.h"
#include "ProbeLog.h"

void Command::printHelp(ByteTransport &out) const {
  out.printf("Help: %s\r\n", name);
  out.printf("  %s\r\n", desc);
  if (help && *help) {
    out.print("  ");
    out.println(help);
  }
}

bool CommandRegistry::registerCommand(const Command &cmd) {
  if (count_ >= kMaxCommands) {
    PINPROBE_LOGW("command table full (%u), dropping '%s'", static_cast<unsigned>(kMaxCommands),
                  cmd.name);
    return false;
  }
  commands_[count_++] = cmd;
  return true;
}

bool CommandRegistry::get(const char *name, const Command **out, ProbeError &err) const {
  for (size_t i = 0; i < count_; ++i) {
    if (equalsIgnoreCase(commands_[i].name, name)) {
      *out = &commands_[i];
      return true;
    }
  }
  return err.set(ErrorCode::CmdNotFound, "%s", name ? name : "");
}

bool Dispatcher::printHelp(const ParsedCommand &parsed, ByteTransport &out,
                           ProbeError &err) const {
  if (parsed.argc > 0) {
    // Both "help blink" and "help cmd=blink" name a command.
    const Argument &arg = parsed.args[0];
    const char *target = arg.value[0] ? arg.value : arg.param;
    const Command *cmd = nullptr;
    if (!registry_.get(target, &cmd, err)) {
      return false;
    }
    cmd->printHelp(out);
    return true;
  }
  out.println("---- Commands ----");
  for (size_t i = 0; i < registry_.size(); ++i) {
    const Command &cmd = registry_.at(i);
    out.printf("  %-14s %s\r\n", cmd.name, cmd.desc);
  }
  out.println("Type \"help <command>\" or \"<command> help\" for details.");
  return true;
}

bool Dispatcher::execute(const char *line, Device &device, ProbeError &err) {
  ParsedCommand parsed;
  if (!parseCommand(line, parsed, err)) {
    return false;
  }
  if (equalsIgnoreCase(parsed.name, kDefaultCommand)) {
    return printHelp(parsed, device.transport(), err);
  }
  const Command *cmd = nullptr;
  if (!registry_.get(parsed.name, &cmd, err)) {
    return false;
  }
  PINPROBE_LOGT("running '%s' with %u args", cmd->name, static_cast<unsigned>(parsed.argc));
  return cmd->handler(*cmd, parsed, device, err);
}
