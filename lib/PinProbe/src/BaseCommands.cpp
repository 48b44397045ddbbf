#include "ProbeCommands.h"

#include "ProbeLog.h"

static const uint32_t kDefaultRefOhms = 10000;
static const uint16_t kDefaultSampleIntervalMs = 200;

bool resolvePinArg(const ParsedCommand &args, Device &device, const char *defaultAlias,
                   uint8_t *gpio, const char **alias, ProbeError &err) {
  uint8_t id = 0;
  const bool hasId = args.getU8("gpio", &id, err);
  if (!optionalArg(hasId, err)) {
    return false;
  }
  return device.pins().getGpioAliasPair(hasId, id, args.getStr("alias", defaultAlias), gpio,
                                        alias, err);
}

static bool resetCmd(const Command &cmd, const ParsedCommand &args, Device &device,
                     ProbeError &err) {
  (void)err;
  if (args.hasParam("help")) {
    cmd.printHelp(device.transport());
    return true;
  }
  device.transport().println();
  device.transport().println("Resetting...");
  device.board().delayMs(500);
  device.board().restart();
  return true;
}

static bool flashCmd(const Command &cmd, const ParsedCommand &args, Device &device,
                     ProbeError &err) {
  (void)err;
  if (args.hasParam("help")) {
    cmd.printHelp(device.transport());
    return true;
  }
  device.transport().println();
  device.transport().println("Restarting in USB Flash mode!...");
  device.board().delayMs(500);
  device.board().restartToBootloader();
  return true;
}

static bool pinCmd(const Command &cmd, const ParsedCommand &args, Device &device,
                   ProbeError &err) {
  ByteTransport &out = device.transport();
  if (args.hasParam("help")) {
    cmd.printHelp(out);
    return true;
  }
  uint8_t gpio = 0;
  const char *alias = nullptr;
  if (!resolvePinArg(args, device, "LED", &gpio, &alias, err)) {
    return false;
  }
  const bool high = args.hasParam("high");
  const bool low = args.hasParam("low");
  const bool toggle = args.hasParam("toggle");

  DigitalPin *output = device.outputs().find(gpio);
  if (output) {
    if (high) {
      device.writeOutput(*output, true);
      out.printf("GPIO %u (%s): Set HIGH\r\n", gpio, alias);
    } else if (low) {
      device.writeOutput(*output, false);
      out.printf("GPIO %u (%s): Set LOW\r\n", gpio, alias);
    } else if (toggle) {
      device.writeOutput(*output, !output->level);
      out.printf("GPIO %u (%s): Toggled %s\r\n", gpio, alias, output->level ? "HIGH" : "LOW");
    } else {
      out.printf("GPIO %u (%s): %s (output)\r\n", gpio, alias, output->level ? "HIGH" : "LOW");
    }
    return true;
  }

  DigitalPin *input = device.inputs().find(gpio);
  if (input) {
    if (high || low || toggle) {
      return err.set(ErrorCode::PinNotConfigured, "%s is an input", alias);
    }
    out.printf("GPIO %u (%s): %s (input)\r\n", gpio, alias,
               device.readInput(*input) ? "HIGH" : "LOW");
    return true;
  }
  return err.set(ErrorCode::PinNotConfigured, "gpio %u (%s) is not digital", gpio, alias);
}

static bool pinsCmd(const Command &cmd, const ParsedCommand &args, Device &device,
                    ProbeError &err) {
  (void)err;
  ByteTransport &out = device.transport();
  if (args.hasParam("help")) {
    cmd.printHelp(out);
    return true;
  }
  ResourceTable &pins = device.pins();
  out.println("---- Pins ----");
  for (size_t i = 0; i < pins.size(); ++i) {
    const PinDef &def = pins.at(i);
    out.printf("  %-10s gpio %2u  %-10s %s\r\n", def.alias, def.id, pinGroupName(def.group),
               pins.isClaimed(def.id) ? "claimed" : "free");
  }
  return true;
}

static bool readAdcCmd(const Command &cmd, const ParsedCommand &args, Device &device,
                       ProbeError &err) {
  ByteTransport &out = device.transport();
  if (args.hasParam("help")) {
    cmd.printHelp(out);
    return true;
  }
  uint32_t refOhms = kDefaultRefOhms;
  if (!optionalArg(args.getU32("ref_res", &refOhms, err), err)) {
    return false;
  }
  out.println("---- Read ADC ----");
  out.printf("Reference Pullup Resistor: %uohm\r\n", static_cast<unsigned>(refOhms));
  for (size_t i = 0; i < device.adcs().size(); ++i) {
    uint16_t raw = 0;
    if (!device.readAdcChannel(static_cast<uint8_t>(i), &raw)) {
      continue;
    }
    out.printf("> ADC %u (%s): v:%.2f, ohm:%.1f, raw:%u\r\n", static_cast<unsigned>(i),
               device.adcs().at(i).handle.alias, adcRawToVolts(raw),
               adcRawToOhms(raw, refOhms), raw);
  }
  out.printf("Chip Temp: C:%.1f\r\n", device.board().chipTemperatureC());
  return true;
}

static bool sampleAdcCmd(const Command &cmd, const ParsedCommand &args, Device &device,
                         ProbeError &err) {
  ByteTransport &out = device.transport();
  if (args.hasParam("help")) {
    cmd.printHelp(out);
    return true;
  }
  uint8_t channel = 0;
  uint8_t gpio = 0;
  uint32_t refOhms = kDefaultRefOhms;
  uint16_t interval = kDefaultSampleIntervalMs;
  if (!optionalArg(args.getU8("channel", &channel, err), err) ||
      !optionalArg(args.getU32("ref_res", &refOhms, err), err) ||
      !optionalArg(args.getU16("interval", &interval, err), err)) {
    return false;
  }
  const bool hasGpio = args.getU8("gpio", &gpio, err);
  if (!optionalArg(hasGpio, err)) {
    return false;
  }
  const char *alias = args.getStr("alias", nullptr);
  if (hasGpio || alias) {
    if (!device.pins().getGpioAliasPair(hasGpio, gpio, alias, &gpio, &alias, err)) {
      return false;
    }
    const int idx = device.adcs().indexOf(gpio);
    if (idx < 0) {
      return err.set(ErrorCode::PinNotConfigured, "gpio %u is not an ADC pin", gpio);
    }
    channel = static_cast<uint8_t>(idx);
  }
  if (channel >= device.adcs().size()) {
    return err.set(ErrorCode::PinNotConfigured, "no ADC channel %u", channel);
  }

  out.println("---- Sample ADC ----");
  out.printf("Reference Pullup Resistor: %uohm\r\n", static_cast<unsigned>(refOhms));
  out.printf("ADC Channel: %u (%s)\r\n", channel, device.adcs().at(channel).handle.alias);
  out.println("Send '~' to exit");
  out.println();

  device.transport().clearInterrupt();
  while (!device.cancelRequested()) {
    uint16_t raw = 0;
    if (device.readAdcChannel(channel, &raw)) {
      out.printf("> v:%.2f, ohm:%.1f, raw:%u\r\n", adcRawToVolts(raw),
                 adcRawToOhms(raw, refOhms), raw);
    } else {
      out.printf("Cannot read channel: %u\r\n", channel);
    }
    if (!device.waitMs(interval)) {
      break;
    }
  }
  out.println("Sampling Interrupted. Done!");
  return true;
}

static bool setPwmCmd(const Command &cmd, const ParsedCommand &args, Device &device,
                      ProbeError &err) {
  ByteTransport &out = device.transport();
  if (args.hasParam("help")) {
    cmd.printHelp(out);
    return true;
  }
  uint8_t gpio = 0;
  const char *alias = nullptr;
  if (!resolvePinArg(args, device, "PWM0_A", &gpio, &alias, err)) {
    return false;
  }
  PwmOutput *pwm = device.pwms().find(gpio);
  if (!pwm) {
    return err.set(ErrorCode::PinNotConfigured, "gpio %u is not a PWM pin", gpio);
  }

  uint32_t freq = kPwmDefaultFreqHz;
  uint8_t duty = 50;
  uint32_t dutyUs = 0;
  uint32_t top = 0;
  bool phase = false;
  bool disable = false;
  const bool hasDutyUs = args.getU32("duty_us", &dutyUs, err);
  if (!optionalArg(hasDutyUs, err) || !optionalArg(args.getU32("freq", &freq, err), err) ||
      !optionalArg(args.getU8("duty", &duty, err), err) ||
      !optionalArg(args.getU32("top", &top, err), err) ||
      !optionalArg(args.getBool("phase", &phase, err), err) ||
      !optionalArg(args.getBool("disable", &disable, err), err)) {
    return false;
  }

  out.println("---- PWM ----");
  out.printf("PWM%u_%c on GPIO %u (%s)\r\n", pwm->slice, (pwm->channel % 2) ? 'B' : 'A', gpio,
             alias);
  if (disable) {
    device.disablePwm(*pwm);
    out.println("PWM pin disabled");
    return true;
  }
  if (!device.configurePwm(*pwm, freq, top, err)) {
    return false;
  }
  out.printf("Setting PWM | freq: %uhz, top: %u, phase: %s ", static_cast<unsigned>(freq),
             static_cast<unsigned>(device.pwmFullScale(*pwm) - 1), phase ? "true" : "false");
  if (hasDutyUs) {
    device.setPwmDutyUs(*pwm, dutyUs, phase);
    out.printf("duty: %uus\r\n", static_cast<unsigned>(dutyUs));
  } else {
    if (duty > 100) {
      duty = 100;
    }
    device.setPwmDutyPercent(*pwm, duty, phase);
    out.printf("duty: %u%%\r\n", duty);
  }
  return true;
}

static bool logCmd(const Command &cmd, const ParsedCommand &args, Device &device,
                   ProbeError &err) {
  ByteTransport &out = device.transport();
  if (args.hasParam("help")) {
    cmd.printHelp(out);
    return true;
  }
  const char *text = args.getStr("level", nullptr);
  if (!text && args.argc > 0 && args.args[0].value[0] == '\0') {
    text = args.args[0].param;
  }
  if (text) {
    LogLevel level = LogLevel::Trace;
    if (!parseLogLevel(text, &level)) {
      return err.set(ErrorCode::Parse, "level %s", text);
    }
    probeLog().setLevel(level);
  }
  out.printf("Log level: %s\r\n", logLevelName(probeLog().level()));
  return true;
}

static bool statusCmd(const Command &cmd, const ParsedCommand &args, Device &device,
                      ProbeError &err) {
  (void)err;
  ByteTransport &out = device.transport();
  if (args.hasParam("help")) {
    cmd.printHelp(out);
    return true;
  }
  Board &board = device.board();
  size_t claimed = 0;
  for (size_t i = 0; i < device.pins().size(); ++i) {
    if (device.pins().isClaimed(device.pins().at(i).id)) {
      claimed++;
    }
  }
  out.println("---- Status ----");
  out.printf("Timer: %.3fs\r\n", static_cast<double>(board.micros()) / 1000000.0);
  out.printf("CPU: %u MHz\r\n", static_cast<unsigned>(board.cpuFreqMHz()));
  out.printf("Chip Temp: %.1fC\r\n", board.chipTemperatureC());
  out.printf("Log level: %s\r\n", logLevelName(probeLog().level()));
  out.printf("Pins: %u defined, %u claimed\r\n", static_cast<unsigned>(device.pins().size()),
             static_cast<unsigned>(claimed));
  out.printf("Core 1 queue: %u/%u\r\n", static_cast<unsigned>(device.coreQueue().size()),
             static_cast<unsigned>(CoreQueue::kCapacity));
  out.printf("Dropped output: %u\r\n", static_cast<unsigned>(device.transport().droppedWrites()));
  return true;
}

static const Command kBaseCommands[] = {
    {"reset", "Resets Device", "reset [help]", resetCmd},
    {"flash", "Restart device in USB Flash mode", "flash [help]", flashCmd},
    {"pin", "Read or set a digital pin",
     "pin [alias=LED|gpio=<u8>] [high] [low] [toggle] [help]", pinCmd},
    {"pins", "List the pin table and claims", "pins [help]", pinsCmd},
    {"read_adc", "Read all ADC channels", "read_adc [ref_res=10000(ohm)] [help]", readAdcCmd},
    {"sample_adc", "Continuous sampling of an ADC channel",
     "sample_adc [channel=0|gpio=<u8>|alias=<name>] [ref_res=10000(ohm)] [interval=200(ms)]"
     " [help]\r\n  Interrupt with char \"~\"",
     sampleAdcCmd},
    {"set_pwm", "Sets PWM (defaults to PWM0_A)",
     "set_pwm [alias=PWM0_A|gpio=<u8>] [freq=50(hz)] [duty=50(%)|duty_us=<us>] [top=<u32>]"
     " [phase] [disable] [help]",
     setPwmCmd},
    {"pwm", "Alias of set_pwm", "pwm [same arguments as set_pwm]", setPwmCmd},
    {"log", "Show or set the log level", "log [level=off|error|warn|info|debug|trace] [help]",
     logCmd},
    {"status", "Show device status", "status [help]", statusCmd},
};

size_t registerBaseCommands(CommandRegistry &registry) {
  size_t added = 0;
  for (size_t i = 0; i < sizeof(kBaseCommands) / sizeof(kBaseCommands[0]); ++i) {
    if (registry.registerCommand(kBaseCommands[i])) {
      added++;
    }
  }
  return added;
}

size_t registerBuiltinCommands(CommandRegistry &registry) {
  return registerBaseCommands(registry) + registerExampleCommands(registry);
}
