#include "Esp32Timers.h"

#include "ProbeLog.h"

void Esp32CountDown::start(uint32_t periodUs) {
  periodUs_ = periodUs;
  nextUs_ = esp_timer_get_time() + periodUs;
  running_ = true;
}

bool Esp32CountDown::expired() {
  if (!running_) {
    return false;
  }
  const int64_t now = esp_timer_get_time();
  if (now < nextUs_) {
    return false;
  }
  nextUs_ += periodUs_;
  // Skip missed periods instead of firing a burst.
  if (nextUs_ <= now) {
    nextUs_ = now + periodUs_;
  }
  return true;
}

void Esp32CountDown::cancel() { running_ = false; }

void ServiceTicker::onTick(void *arg) {
  static_cast<ServiceTicker *>(arg)->transport_.pollForInterruptChar();
}

bool ServiceTicker::start(uint32_t periodMs) {
  if (timer_) {
    return true;
  }
  esp_timer_create_args_t args = {};
  args.callback = &ServiceTicker::onTick;
  args.arg = this;
  args.dispatch_method = ESP_TIMER_TASK;
  args.name = "pinprobe_svc";
  esp_err_t rc = esp_timer_create(&args, &timer_);
  if (rc != ESP_OK) {
    PINPROBE_LOGE("esp_timer_create failed: %d", static_cast<int>(rc));
    timer_ = nullptr;
    return false;
  }
  rc = esp_timer_start_periodic(timer_, static_cast<uint64_t>(periodMs) * 1000ULL);
  if (rc != ESP_OK) {
    PINPROBE_LOGE("esp_timer_start_periodic failed: %d", static_cast<int>(rc));
    esp_timer_delete(timer_);
    timer_ = nullptr;
    return false;
  }
  return true;
}
