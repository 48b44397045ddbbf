#include "ProbeCommands.h"

#include <stdlib.h>

#include "ProbeLog.h"
#include "Tasklet.h"

static const uint16_t kServoMidUs = 1500;
static const uint32_t kServoFreqHz = 50;
static const uint32_t kAnalogPwmFreqHz = 60;
static const size_t kMaxSpiBytes = 32;

static void printHexLine(ByteTransport &out, const char *prefix, const uint8_t *data, size_t len) {
  out.print(prefix);
  for (size_t i = 0; i < len; ++i) {
    out.printf(" %02X", data[i]);
  }
  out.println();
}

static bool exampleCmd(const Command &cmd, const ParsedCommand &args, Device &device,
                       ProbeError &err) {
  ByteTransport &out = device.transport();
  if (args.hasParam("help")) {
    cmd.printHelp(out);
    return true;
  }
  float arg = 0.0f;
  uint8_t opt = 0;
  bool on = false;
  if (!args.getFloat("arg", &arg, err)) {
    return false;
  }
  if (!optionalArg(args.getU8("opt", &opt, err), err) ||
      !optionalArg(args.getBool("on", &on, err), err)) {
    return false;
  }
  const char *path = args.getStr("path", "");

  out.println("---- Running 'Example' ----");
  out.println();
  out.printf("arg = %g\r\n", arg);
  out.printf("opt = %u\r\n", opt);
  out.printf("on = %s\r\n", on ? "true" : "false");
  out.printf("path = %s\r\n", path);
  return true;
}

static bool blinkCmd(const Command &cmd, const ParsedCommand &args, Device &device,
                     ProbeError &err) {
  ByteTransport &out = device.transport();
  if (args.hasParam("help")) {
    cmd.printHelp(out);
    return true;
  }
  uint16_t times = 10;
  uint16_t interval = 200;
  if (!optionalArg(args.getU16("times", &times, err), err) ||
      !optionalArg(args.getU16("interval", &interval, err), err)) {
    return false;
  }
  if (times > 0x7FFF) {
    times = 0x7FFF;
  }
  DigitalPin *led = device.statusLed();
  if (!led) {
    return err.set(ErrorCode::PinNotConfigured, "no LED output");
  }

  out.println("---- Blinking Led! ----");
  device.transport().clearInterrupt();
  Tasklet ledTask(interval, static_cast<uint16_t>(times * 2), device.countDown());
  unsigned blink = 1;
  while (!ledTask.isExhausted()) {
    if (device.cancelRequested()) {
      ledTask.cancel();
      out.println();
      out.println("Blink Interrupted");
      break;
    }
    if (ledTask.isReady()) {
      device.writeOutput(*led, !led->level);
      if (led->level) {
        out.printf("Blink %u | ", blink++);
      }
    }
  }
  out.println();
  return true;
}

static bool blinkCore1Cmd(const Command &cmd, const ParsedCommand &args, Device &device,
                          ProbeError &err) {
  ByteTransport &out = device.transport();
  if (args.hasParam("help")) {
    cmd.printHelp(out);
    return true;
  }
  uint16_t times = 5;
  uint16_t interval = 200;
  if (!optionalArg(args.getU16("times", &times, err), err) ||
      !optionalArg(args.getU16("interval", &interval, err), err)) {
    return false;
  }
  if (!device.coreQueue().enqueue(CoreEvent::blink(times, interval))) {
    return err.set(ErrorCode::QueueFull, "core 1 event queue");
  }
  out.printf("Core 1: blink x%u every %ums queued\r\n", times, interval);
  return true;
}

static bool servoCmd(const Command &cmd, const ParsedCommand &args, Device &device,
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
  uint16_t us = kServoMidUs;
  uint32_t pause = 1000;
  bool sweep = false;
  uint16_t maxUs = 2000;
  if (!optionalArg(args.getU16("us", &us, err), err) ||
      !optionalArg(args.getU32("pause", &pause, err), err) ||
      !optionalArg(args.getBool("sweep", &sweep, err), err) ||
      !optionalArg(args.getU16("max_us", &maxUs, err), err)) {
    return false;
  }
  if (maxUs < kServoMidUs) {
    maxUs = kServoMidUs;
  }
  uint16_t span = static_cast<uint16_t>(maxUs - kServoMidUs);
  if (span < 1) {
    span = 1;
  } else if (span > kServoMidUs) {
    span = kServoMidUs;
  }
  const uint16_t minUs = static_cast<uint16_t>(kServoMidUs - span);

  out.println("---- Servo ----");
  out.printf("GPIO %u (%s)\r\n", gpio, alias);
  if (!device.configurePwm(*pwm, kServoFreqHz, 0, err)) {
    return false;
  }
  out.printf("Setting PWM: Duty: %uus, Freq: %u\r\n", us, static_cast<unsigned>(kServoFreqHz));
  device.transport().clearInterrupt();
  device.setPwmDutyUs(*pwm, us, false);
  bool running = device.waitMs(pause);

  if (sweep && running) {
    const uint16_t steps[] = {maxUs, kServoMidUs, minUs, kServoMidUs};
    const char *const labels[] = {"Max", "Mid", "Min", "Mid"};
    out.println("Sweeping...");
    for (size_t i = 0; i < 4 && running; ++i) {
      device.setPwmDutyUs(*pwm, steps[i], false);
      out.printf("%s: %uus\r\n", labels[i], steps[i]);
      running = device.waitMs(pause);
    }
  }

  device.disablePwm(*pwm);
  out.println(running ? "Done!" : "Servo Interrupted");
  return true;
}

static bool testGpioCmd(const Command &cmd, const ParsedCommand &args, Device &device,
                        ProbeError &err) {
  ByteTransport &out = device.transport();
  if (args.hasParam("help")) {
    cmd.printHelp(out);
    return true;
  }
  DigitalPin *input = device.inputs().findByAlias(args.getStr("input", "IN_A"));
  if (!input) {
    return err.set(ErrorCode::PinNotConfigured, "input %s", args.getStr("input", "IN_A"));
  }
  DigitalPin *output = device.outputs().findByAlias(args.getStr("output", "OUT_A"));
  if (!output) {
    return err.set(ErrorCode::PinNotConfigured, "output %s", args.getStr("output", "OUT_A"));
  }

  out.println("---- Testing GPIO ----");
  out.printf("%s low >> %s high\r\n", input->handle.alias, output->handle.alias);
  out.println("Send '~' to exit");

  device.transport().clearInterrupt();
  while (!device.cancelRequested()) {
    const bool high = !device.readInput(*input);
    if (high != output->level) {
      device.writeOutput(*output, high);
    }
  }
  out.println("Done!");
  return true;
}

static bool testAnalogCmd(const Command &cmd, const ParsedCommand &args, Device &device,
                          ProbeError &err) {
  ByteTransport &out = device.transport();
  if (args.hasParam("help")) {
    cmd.printHelp(out);
    return true;
  }
  AdcInput *input = device.adcs().findByAlias(args.getStr("input", "ADC0"));
  if (!input) {
    return err.set(ErrorCode::PinNotConfigured, "input %s", args.getStr("input", "ADC0"));
  }
  const uint8_t channel = static_cast<uint8_t>(device.adcs().indexOf(input->handle.gpio));
  PwmOutput *pwm = device.pwms().findByAlias(args.getStr("output", "PWM0_A"));
  if (!pwm) {
    return err.set(ErrorCode::PinNotConfigured, "output %s", args.getStr("output", "PWM0_A"));
  }
  uint16_t minUs = 0;
  uint16_t maxUs = 0;
  const bool hasMin = args.getU16("min_us", &minUs, err);
  if (!optionalArg(hasMin, err)) {
    return false;
  }
  const bool hasMax = args.getU16("max_us", &maxUs, err);
  if (!optionalArg(hasMax, err)) {
    return false;
  }
  const bool servoMode = hasMin || hasMax;
  if (servoMode) {
    if (!hasMin) {
      minUs = 1000;
    }
    if (!hasMax) {
      maxUs = 2000;
    }
    if (maxUs <= minUs) {
      return err.set(ErrorCode::Parse, "max_us must exceed min_us");
    }
  }

  out.println("---- Testing Analog Input ----");
  out.printf("Input: %s >> PWM Output: %s\r\n", device.adcs().at(channel).handle.alias,
             pwm->handle.alias);
  out.println("Send '~' to exit");

  if (!device.configurePwm(*pwm, servoMode ? kServoFreqHz : kAnalogPwmFreqHz, 0, err)) {
    return false;
  }
  device.setPwmDutyPercent(*pwm, 0, false);

  device.transport().clearInterrupt();
  while (!device.cancelRequested()) {
    uint16_t raw = 0;
    if (!device.readAdcChannel(channel, &raw)) {
      continue;
    }
    float volts = adcRawToVolts(raw);
    if (volts > kAdcRefVolts) {
      volts = kAdcRefVolts;
    }
    if (servoMode) {
      const uint32_t us = minUs + static_cast<uint32_t>((maxUs - minUs) * volts / kAdcRefVolts);
      device.setPwmDutyUs(*pwm, us, false);
    } else if (volts < 0.1f) {
      device.setPwmDutyPercent(*pwm, 0, false);
    } else {
      device.setPwmDutyPercent(*pwm, static_cast<uint8_t>(volts * 100.0f / kAdcRefVolts), false);
    }
  }

  device.disablePwm(*pwm);
  out.println("Done!");
  return true;
}

static bool i2cScanCmd(const Command &cmd, const ParsedCommand &args, Device &device,
                       ProbeError &err) {
  ByteTransport &out = device.transport();
  if (args.hasParam("help")) {
    cmd.printHelp(out);
    return true;
  }
  uint8_t start = 0x08;
  uint8_t end = 0x77;
  if (!optionalArg(args.getU8("start", &start, err), err) ||
      !optionalArg(args.getU8("end", &end, err), err)) {
    return false;
  }
  if (start > end || end > 0x7F) {
    return err.set(ErrorCode::Parse, "range 0x%02X..0x%02X", start, end);
  }
  if (!device.ensureI2c(err)) {
    return false;
  }

  out.printf("---- I2C scan 0x%02X..0x%02X ----\r\n", start, end);
  device.transport().clearInterrupt();
  unsigned found = 0;
  for (unsigned addr = start; addr <= end; ++addr) {
    if (device.cancelRequested()) {
      out.println("Scan Interrupted");
      break;
    }
    if (device.board().i2cProbe(static_cast<uint8_t>(addr))) {
      out.printf("Found device at 0x%02X\r\n", addr);
      found++;
    }
  }
  out.printf("%u device(s) found\r\n", found);
  return true;
}

// Accepts "9f 00", "0x9f,0x00" and similar.
static bool parseHexBytes(const char *text, uint8_t *out, size_t maxLen, size_t *len,
                          ProbeError &err) {
  size_t count = 0;
  const char *p = text;
  while (*p) {
    if (*p == ' ' || *p == ',' || *p == '\t') {
      ++p;
      continue;
    }
    char *end = nullptr;
    const unsigned long val = strtoul(p, &end, 16);
    if (end == p || val > 0xFF || (*end && *end != ' ' && *end != ',' && *end != '\t')) {
      return err.set(ErrorCode::Parse, "bytes");
    }
    if (count >= maxLen) {
      return err.set(ErrorCode::ArgTooLong, "max %u bytes", static_cast<unsigned>(maxLen));
    }
    out[count++] = static_cast<uint8_t>(val);
    p = end;
  }
  if (count == 0) {
    return err.set(ErrorCode::Parse, "no data bytes");
  }
  *len = count;
  return true;
}

static bool spiXferCmd(const Command &cmd, const ParsedCommand &args, Device &device,
                       ProbeError &err) {
  ByteTransport &out = device.transport();
  if (args.hasParam("help")) {
    cmd.printHelp(out);
    return true;
  }
  uint32_t freq = 1000000;
  uint8_t mode = 0;
  if (!optionalArg(args.getU32("freq", &freq, err), err) ||
      !optionalArg(args.getU8("mode", &mode, err), err)) {
    return false;
  }
  if (mode > 3) {
    return err.set(ErrorCode::Parse, "mode %u", mode);
  }
  uint8_t tx[kMaxSpiBytes];
  uint8_t rx[kMaxSpiBytes];
  size_t len = 0;
  if (!parseHexBytes(args.getStr("bytes", "9f 00"), tx, kMaxSpiBytes, &len, err)) {
    return false;
  }
  if (!device.ensureSpi(err)) {
    return false;
  }
  const uint8_t cs = device.spiCsPin();
  device.board().writePin(cs, false);
  device.board().spiTransfer(tx, rx, len, freq, mode);
  device.board().writePin(cs, true);
  printHexLine(out, "SPI TX:", tx, len);
  printHexLine(out, "SPI RX:", rx, len);
  return true;
}

static bool testLogCmd(const Command &cmd, const ParsedCommand &args, Device &device,
                       ProbeError &err) {
  (void)err;
  ByteTransport &out = device.transport();
  if (args.hasParam("help")) {
    cmd.printHelp(out);
    return true;
  }
  out.printf("Log level: %s\r\n", logLevelName(probeLog().level()));
  PINPROBE_LOGE("error line");
  PINPROBE_LOGW("warn line");
  PINPROBE_LOGI("info line");
  PINPROBE_LOGD("debug line");
  PINPROBE_LOGT("trace line");
  return true;
}

static const Command kExampleCommands[] = {
    {"example", "Prints example args",
     "example arg=<float> [opt=0(u8)] [on=false(bool)] [path=\"\"(string)] [help]", exampleCmd},
    {"blink", "Blinks Onboard Led", "blink [times=10] [interval=200(ms)] [help]", blinkCmd},
    {"blink_core1", "Blinks a Led from core 1", "blink_core1 [times=5] [interval=200(ms)] [help]",
     blinkCore1Cmd},
    {"servo", "Drives a servo on a PWM pin",
     "servo [alias=PWM0_A|gpio=<u8>] [us=1500(us)] [pause=1000(ms)] [sweep] [max_us=2000(us)]"
     " [help]",
     servoCmd},
    {"test_gpio", "Sets output high while input is low",
     "test_gpio [input=IN_A] [output=OUT_A] [help]\r\n  Interrupt with char \"~\"", testGpioCmd},
    {"test_analog", "Voltage controlled PWM duty cycle",
     "test_analog [input=ADC0] [output=PWM0_A] [min_us] [max_us] [help]\r\n"
     "  Interrupt with char \"~\"",
     testAnalogCmd},
    {"i2c_scan", "Scan the I2C bus for devices", "i2c_scan [start=0x08] [end=0x77] [help]",
     i2cScanCmd},
    {"spi_xfer", "Full duplex SPI transfer",
     "spi_xfer [bytes=\"9f 00\"] [freq=1000000(hz)] [mode=0] [help]", spiXferCmd},
    {"test_log", "Emit one line per log level", "test_log [help]", testLogCmd},
};

size_t registerExampleCommands(CommandRegistry &registry) {
  size_t added = 0;
  for (size_t i = 0; i < sizeof(kExampleCommands) / sizeof(kExampleCommands[0]); ++i) {
    if (registry.registerCommand(kExampleCommands[i])) {
      added++;
    }
  }
  return added;
}
