#pragma once

#include <stddef.h>
#include <stdint.h>

#if defined(ARDUINO_ARCH_ESP32)
#include "soc/soc_caps.h"
#endif

#ifndef PINPROBE_SERIAL_BAUD
#define PINPROBE_SERIAL_BAUD 2000000
#endif

#ifndef PINPROBE_WRITE_BUFFER_SIZE
#define PINPROBE_WRITE_BUFFER_SIZE 128
#endif

#ifndef PINPROBE_LINE_BUFFER_SIZE
#define PINPROBE_LINE_BUFFER_SIZE 192
#endif

#ifndef PINPROBE_MAX_ARGS
#define PINPROBE_MAX_ARGS 5
#endif

#ifndef PINPROBE_MAX_CMD_NAME_LENGTH
#define PINPROBE_MAX_CMD_NAME_LENGTH 24
#endif

#ifndef PINPROBE_MAX_PARAM_LENGTH
#define PINPROBE_MAX_PARAM_LENGTH 16
#endif

#ifndef PINPROBE_MAX_VALUE_LENGTH
#define PINPROBE_MAX_VALUE_LENGTH 64
#endif

#ifndef PINPROBE_MAX_COMMANDS
#define PINPROBE_MAX_COMMANDS 20
#endif

#ifndef PINPROBE_MAX_PINS
#define PINPROBE_MAX_PINS 48
#endif

#ifndef PINPROBE_GPIO_COUNT
#if defined(SOC_GPIO_PIN_COUNT)
#define PINPROBE_GPIO_COUNT SOC_GPIO_PIN_COUNT
#else
#define PINPROBE_GPIO_COUNT 49
#endif
#endif

#ifndef PINPROBE_INTERRUPT_CHAR
#define PINPROBE_INTERRUPT_CHAR '~'
#endif

#ifndef PINPROBE_SERVICE_PERIOD_MS
#define PINPROBE_SERVICE_PERIOD_MS 10
#endif

#ifndef PINPROBE_WRITE_SPIN_LIMIT
#define PINPROBE_WRITE_SPIN_LIMIT 20000
#endif

#ifndef PINPROBE_DEFAULT_LOG_LEVEL
#define PINPROBE_DEFAULT_LOG_LEVEL 5
#endif

#ifndef PINPROBE_EVENT_QUEUE_DEPTH
#define PINPROBE_EVENT_QUEUE_DEPTH 8
#endif

static_assert(PINPROBE_WRITE_BUFFER_SIZE >= 64, "PINPROBE_WRITE_BUFFER_SIZE must be >= 64");
static_assert(PINPROBE_LINE_BUFFER_SIZE >= 32, "PINPROBE_LINE_BUFFER_SIZE must be >= 32");
static_assert(PINPROBE_MAX_ARGS > 0, "PINPROBE_MAX_ARGS must be > 0");
static_assert(PINPROBE_MAX_CMD_NAME_LENGTH > 4,
              "PINPROBE_MAX_CMD_NAME_LENGTH must hold the 'help' command");
static_assert(PINPROBE_MAX_PARAM_LENGTH > 0, "PINPROBE_MAX_PARAM_LENGTH must be > 0");
static_assert(PINPROBE_MAX_VALUE_LENGTH > 0, "PINPROBE_MAX_VALUE_LENGTH must be > 0");
static_assert(PINPROBE_MAX_COMMANDS > 0, "PINPROBE_MAX_COMMANDS must be > 0");
static_assert(PINPROBE_MAX_PINS > 0, "PINPROBE_MAX_PINS must be > 0");
static_assert(PINPROBE_GPIO_COUNT > 0 && PINPROBE_GPIO_COUNT < 255,
              "PINPROBE_GPIO_COUNT must fit in a uint8_t pin id");
static_assert(PINPROBE_SERVICE_PERIOD_MS > 0 && PINPROBE_SERVICE_PERIOD_MS <= 10,
              "PINPROBE_SERVICE_PERIOD_MS must be 1..10 to keep USB serviced");
static_assert(PINPROBE_WRITE_SPIN_LIMIT > 0, "PINPROBE_WRITE_SPIN_LIMIT must be > 0");
static_assert(PINPROBE_DEFAULT_LOG_LEVEL >= 0 && PINPROBE_DEFAULT_LOG_LEVEL <= 5,
              "PINPROBE_DEFAULT_LOG_LEVEL must be 0..5");
static_assert(PINPROBE_EVENT_QUEUE_DEPTH > 1, "PINPROBE_EVENT_QUEUE_DEPTH must be > 1");

static const size_t kWriteBufferSize = static_cast<size_t>(PINPROBE_WRITE_BUFFER_SIZE);
static const size_t kLineBufferSize = static_cast<size_t>(PINPROBE_LINE_BUFFER_SIZE);
static const size_t kMaxArgs = static_cast<size_t>(PINPROBE_MAX_ARGS);
static const size_t kMaxCmdNameLength = static_cast<size_t>(PINPROBE_MAX_CMD_NAME_LENGTH);
static const size_t kMaxParamLength = static_cast<size_t>(PINPROBE_MAX_PARAM_LENGTH);
static const size_t kMaxValueLength = static_cast<size_t>(PINPROBE_MAX_VALUE_LENGTH);
static const size_t kMaxCommands = static_cast<size_t>(PINPROBE_MAX_COMMANDS);
static const size_t kMaxPins = static_cast<size_t>(PINPROBE_MAX_PINS);
static const uint8_t kGpioCount = static_cast<uint8_t>(PINPROBE_GPIO_COUNT);
static const uint8_t kInterruptChar = static_cast<uint8_t>(PINPROBE_INTERRUPT_CHAR);
static const uint8_t kCtrlC = 0x03;
static const uint32_t kServicePeriodMs = static_cast<uint32_t>(PINPROBE_SERVICE_PERIOD_MS);
static const uint32_t kWriteSpinLimit = static_cast<uint32_t>(PINPROBE_WRITE_SPIN_LIMIT);
static const size_t kEventQueueDepth = static_cast<size_t>(PINPROBE_EVENT_QUEUE_DEPTH);
