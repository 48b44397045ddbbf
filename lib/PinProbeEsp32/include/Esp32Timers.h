#pragma once

#include <esp_timer.h>
#include <stdint.h>

#include "ByteTransport.h"
#include "Tasklet.h"

// Periodic countdown on the 64-bit esp_timer clock.
class Esp32CountDown : public CountDown {
 public:
  void start(uint32_t periodUs) override;
  bool expired() override;
  void cancel() override;

 private:
  int64_t nextUs_ = 0;
  uint32_t periodUs_ = 0;
  bool running_ = false;
};

// The periodic service context. Keeps the USB link polled and watches for the
// break character while the main loop is busy inside a command.
class ServiceTicker {
 public:
  explicit ServiceTicker(ByteTransport &transport) : transport_(transport) {}

  ServiceTicker(const ServiceTicker &) = delete;
  ServiceTicker &operator=(const ServiceTicker &) = delete;

  bool start(uint32_t periodMs);

 private:
  static void onTick(void *arg);

  ByteTransport &transport_;
  esp_timer_handle_t timer_ = nullptr;
};
