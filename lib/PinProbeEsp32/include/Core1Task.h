#pragma once

#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

#include "Board.h"
#include "Device.h"
#include "ResourceTable.h"

// Independent loop pinned to the second core. Drains the core queue and mirrors
// C1_IN_A onto C1_OUT_A between events.
class Core1Task {
 public:
  Core1Task(CoreQueue &queue, ResourceTable &pins, Board &board);

  Core1Task(const Core1Task &) = delete;
  Core1Task &operator=(const Core1Task &) = delete;

  bool start(ProbeError &err);

 private:
  static const uint32_t kStackWords = 3072;
  static const uint32_t kIdleMs = 10;

  static void taskEntry(void *arg);
  void run();
  void blink(uint16_t times, uint16_t intervalMs);

  CoreQueue &queue_;
  ResourceTable &pins_;
  Board &board_;
  PinHandle led_;
  PinHandle input_;
  PinHandle output_;
  StaticTask_t tcb_;
  StackType_t stack_[kStackWords];
  TaskHandle_t task_ = nullptr;
};
