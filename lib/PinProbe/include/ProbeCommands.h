#pragma once

#include <stddef.h>
#include <stdint.h>

#include "CommandParser.h"
#include "CommandRegistry.h"
#include "Device.h"
#include "ProbeError.h"

// reset, flash, pin, pins, read_adc, sample_adc, set_pwm, pwm, log, status
size_t registerBaseCommands(CommandRegistry &registry);
// example, blink, blink_core1, servo, test_gpio, test_analog, i2c_scan, spi_xfer, test_log
size_t registerExampleCommands(CommandRegistry &registry);
size_t registerBuiltinCommands(CommandRegistry &registry);

// Resolves "gpio=<n>" or "alias=<name>", falling back to defaultAlias.
bool resolvePinArg(const ParsedCommand &args, Device &device, const char *defaultAlias,
                   uint8_t *gpio, const char **alias, ProbeError &err);
