#include "Esp32Board.h"

#include <Arduino.h>
#include <SPI.h>
#include <Wire.h>
#include <driver/ledc.h>
#include <esp_system.h>
#include <soc/rtc_cntl_reg.h>

static const uint8_t kSpiModes[] = {SPI_MODE0, SPI_MODE1, SPI_MODE2, SPI_MODE3};

uint32_t Esp32Board::micros() { return ::micros(); }

void Esp32Board::delayMs(uint32_t ms) { ::delay(ms); }

void Esp32Board::configureOutput(uint8_t gpio) { pinMode(gpio, OUTPUT); }

void Esp32Board::configureInput(uint8_t gpio, bool pullUp) {
  pinMode(gpio, pullUp ? INPUT_PULLUP : INPUT);
}

void Esp32Board::writePin(uint8_t gpio, bool high) { digitalWrite(gpio, high ? HIGH : LOW); }

bool Esp32Board::readPin(uint8_t gpio) { return digitalRead(gpio) == HIGH; }

void Esp32Board::configureAdc(uint8_t gpio) {
  analogReadResolution(12);
  analogSetPinAttenuation(gpio, ADC_11db);
}

uint16_t Esp32Board::readAdc(uint8_t gpio) { return static_cast<uint16_t>(analogRead(gpio)); }

float Esp32Board::chipTemperatureC() { return temperatureRead(); }

bool Esp32Board::pwmConfigureSlice(uint8_t slice, uint32_t freqHz, uint8_t resolutionBits,
                                   ProbeError &err) {
  if (slice >= LEDC_TIMER_MAX) {
    return err.set(ErrorCode::InvalidEndpoint, "no LEDC timer %u", slice);
  }
  ledc_timer_config_t timer = {};
  timer.speed_mode = LEDC_LOW_SPEED_MODE;
  timer.timer_num = static_cast<ledc_timer_t>(slice);
  timer.duty_resolution = static_cast<ledc_timer_bit_t>(resolutionBits);
  timer.freq_hz = freqHz;
  timer.clk_cfg = LEDC_AUTO_CLK;
  const esp_err_t rc = ledc_timer_config(&timer);
  if (rc != ESP_OK) {
    return err.set(ErrorCode::CmdExec, "ledc timer %u: %s", slice, esp_err_to_name(rc));
  }
  return true;
}

bool Esp32Board::pwmAttach(uint8_t channel, uint8_t slice, uint8_t gpio, ProbeError &err) {
  if (channel >= LEDC_CHANNEL_MAX) {
    return err.set(ErrorCode::InvalidEndpoint, "no LEDC channel %u", channel);
  }
  ledc_channel_config_t ch = {};
  ch.speed_mode = LEDC_LOW_SPEED_MODE;
  ch.channel = static_cast<ledc_channel_t>(channel);
  ch.timer_sel = static_cast<ledc_timer_t>(slice);
  ch.intr_type = LEDC_INTR_DISABLE;
  ch.gpio_num = gpio;
  ch.duty = 0;
  ch.hpoint = 0;
  const esp_err_t rc = ledc_channel_config(&ch);
  if (rc != ESP_OK) {
    return err.set(ErrorCode::CmdExec, "ledc channel %u: %s", channel, esp_err_to_name(rc));
  }
  return true;
}

void Esp32Board::pwmWrite(uint8_t channel, uint32_t duty, uint32_t hpoint) {
  const ledc_channel_t ch = static_cast<ledc_channel_t>(channel);
  ledc_set_duty_with_hpoint(LEDC_LOW_SPEED_MODE, ch, duty, hpoint);
  ledc_update_duty(LEDC_LOW_SPEED_MODE, ch);
}

void Esp32Board::pwmStop(uint8_t channel) {
  ledc_stop(LEDC_LOW_SPEED_MODE, static_cast<ledc_channel_t>(channel), 0);
}

bool Esp32Board::i2cBegin(uint8_t sda, uint8_t scl, uint32_t freqHz, ProbeError &err) {
  if (!Wire.begin(sda, scl, freqHz)) {
    return err.set(ErrorCode::CmdExec, "Wire.begin failed");
  }
  return true;
}

bool Esp32Board::i2cProbe(uint8_t address) {
  Wire.beginTransmission(address);
  return Wire.endTransmission() == 0;
}

bool Esp32Board::spiBegin(uint8_t sck, uint8_t miso, uint8_t mosi, uint8_t cs, ProbeError &err) {
  (void)err;
  SPI.begin(sck, miso, mosi, cs);
  return true;
}

void Esp32Board::spiTransfer(const uint8_t *tx, uint8_t *rx, size_t len, uint32_t freqHz,
                             uint8_t mode) {
  SPI.beginTransaction(SPISettings(freqHz, MSBFIRST, kSpiModes[mode & 0x03]));
  for (size_t i = 0; i < len; ++i) {
    rx[i] = SPI.transfer(tx[i]);
  }
  SPI.endTransaction();
}

uint32_t Esp32Board::cpuFreqMHz() { return getCpuFrequencyMhz(); }

void Esp32Board::restart() { esp_restart(); }

void Esp32Board::restartToBootloader() {
  // Latched across the software reset; the ROM then enters download mode.
  REG_WRITE(RTC_CNTL_OPTION1_REG, RTC_CNTL_FORCE_DOWNLOAD_BOOT);
  esp_restart();
}
