#pragma once

#include "Board.h"

// Arduino-ESP32 GPIO/ADC/Wire/SPI plus the IDF LEDC driver for PWM. Each PWM
// slice is one low-speed LEDC timer.
class Esp32Board : public Board {
 public:
  uint32_t micros() override;
  void delayMs(uint32_t ms) override;

  void configureOutput(uint8_t gpio) override;
  void configureInput(uint8_t gpio, bool pullUp) override;
  void writePin(uint8_t gpio, bool high) override;
  bool readPin(uint8_t gpio) override;

  void configureAdc(uint8_t gpio) override;
  uint16_t readAdc(uint8_t gpio) override;
  float chipTemperatureC() override;

  bool pwmConfigureSlice(uint8_t slice, uint32_t freqHz, uint8_t resolutionBits,
                         ProbeError &err) override;
  bool pwmAttach(uint8_t channel, uint8_t slice, uint8_t gpio, ProbeError &err) override;
  void pwmWrite(uint8_t channel, uint32_t duty, uint32_t hpoint) override;
  void pwmStop(uint8_t channel) override;

  bool i2cBegin(uint8_t sda, uint8_t scl, uint32_t freqHz, ProbeError &err) override;
  bool i2cProbe(uint8_t address) override;

  bool spiBegin(uint8_t sck, uint8_t miso, uint8_t mosi, uint8_t cs, ProbeError &err) override;
  void spiTransfer(const uint8_t *tx, uint8_t *rx, size_t len, uint32_t freqHz,
                   uint8_t mode) override;

  uint32_t cpuFreqMHz() override;
  void restart() override;
  void restartToBootloader() override;
};
