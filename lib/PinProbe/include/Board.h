#pragma once

#include <stddef.h>
#include <stdint.h>

#include "ProbeError.h"

// Everything the console needs from the chip. Pins are plain GPIO numbers that
// have already been claimed through the ResourceTable.
class Board {
 public:
  virtual ~Board() {}

  virtual uint32_t micros() = 0;
  virtual void delayMs(uint32_t ms) = 0;

  virtual void configureOutput(uint8_t gpio) = 0;
  virtual void configureInput(uint8_t gpio, bool pullUp) = 0;
  virtual void writePin(uint8_t gpio, bool high) = 0;
  virtual bool readPin(uint8_t gpio) = 0;

  // 12-bit raw conversion, 0..kAdcMaxRaw.
  virtual void configureAdc(uint8_t gpio) = 0;
  virtual uint16_t readAdc(uint8_t gpio) = 0;
  virtual float chipTemperatureC() = 0;

  // One timer per slice feeds the two channels of that slice.
  virtual bool pwmConfigureSlice(uint8_t slice, uint32_t freqHz, uint8_t resolutionBits,
                                 ProbeError &err) = 0;
  virtual bool pwmAttach(uint8_t channel, uint8_t slice, uint8_t gpio, ProbeError &err) = 0;
  virtual void pwmWrite(uint8_t channel, uint32_t duty, uint32_t hpoint) = 0;
  virtual void pwmStop(uint8_t channel) = 0;

  virtual bool i2cBegin(uint8_t sda, uint8_t scl, uint32_t freqHz, ProbeError &err) = 0;
  // True when a device acknowledges its address.
  virtual bool i2cProbe(uint8_t address) = 0;

  virtual bool spiBegin(uint8_t sck, uint8_t miso, uint8_t mosi, uint8_t cs, ProbeError &err) = 0;
  virtual void spiTransfer(const uint8_t *tx, uint8_t *rx, size_t len, uint32_t freqHz,
                           uint8_t mode) = 0;

  virtual uint32_t cpuFreqMHz() = 0;
  virtual void restart() = 0;
  virtual void restartToBootloader() = 0;
};

static const uint16_t kAdcMaxRaw = 4095;
static const float kAdcRefVolts = 3.3f;
static const uint32_t kPwmSourceClockHz = 80000000UL;
static const uint8_t kPwmMaxResolutionBits = 14;
