#pragma once

#include <freertos/FreeRTOS.h>
#include <freertos/semphr.h>

#include "SerialPort.h"

// The native USB CDC port (Serial). The CDC stack runs in its own task, so
// poll() only reports whether data is waiting.
class Esp32UsbSerial : public UsbSerialPort {
 public:
  bool poll() override;
  int read(uint8_t *out, size_t len) override;
  int write(const uint8_t *data, size_t len) override;
  bool dtr() const override;
};

// USB calls may block internally, so the transport lock is a mutex rather than
// a critical section.
class FreeRtosLock : public InterruptLock {
 public:
  FreeRtosLock();

  void lock() override;
  bool tryLock() override;
  void unlock() override;

 private:
  StaticSemaphore_t storage_;
  SemaphoreHandle_t handle_;
};

class Esp32SpinDelay : public SpinDelay {
 public:
  void delayMicros(uint32_t us) override;
};
