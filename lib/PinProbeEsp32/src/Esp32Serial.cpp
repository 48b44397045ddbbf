#include "Esp32Serial.h"

#include <Arduino.h>

bool Esp32UsbSerial::poll() { return Serial.available() > 0; }

int Esp32UsbSerial::read(uint8_t *out, size_t len) {
  const int avail = Serial.available();
  if (avail <= 0 || len == 0) {
    return 0;
  }
  const size_t n = (static_cast<size_t>(avail) < len) ? static_cast<size_t>(avail) : len;
  return static_cast<int>(Serial.read(out, n));
}

int Esp32UsbSerial::write(const uint8_t *data, size_t len) {
  const int space = Serial.availableForWrite();
  if (space <= 0 || len == 0) {
    return 0;
  }
  const size_t n = (static_cast<size_t>(space) < len) ? static_cast<size_t>(space) : len;
  return static_cast<int>(Serial.write(data, n));
}

bool Esp32UsbSerial::dtr() const { return static_cast<bool>(Serial); }

FreeRtosLock::FreeRtosLock() { handle_ = xSemaphoreCreateMutexStatic(&storage_); }

void FreeRtosLock::lock() { xSemaphoreTake(handle_, portMAX_DELAY); }

bool FreeRtosLock::tryLock() { return xSemaphoreTake(handle_, 0) == pdTRUE; }

void FreeRtosLock::unlock() { xSemaphoreGive(handle_); }

void Esp32SpinDelay::delayMicros(uint32_t us) { delayMicroseconds(us); }
