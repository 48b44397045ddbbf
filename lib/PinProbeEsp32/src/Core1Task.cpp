#include "Core1Task.h"

#include "ProbeLog.h"

Core1Task::Core1Task(CoreQueue &queue, ResourceTable &pins, Board &board)
    : queue_(queue), pins_(pins), board_(board) {}

bool Core1Task::start(ProbeError &err) {
  if (task_) {
    return err.set(ErrorCode::CmdExec, "core 1 task already running");
  }
  if (!pins_.claimByAlias("C1_LED", PinCapability::DigitalOut, &led_, err) ||
      !pins_.claimByAlias("C1_IN_A", PinCapability::DigitalIn, &input_, err) ||
      !pins_.claimByAlias("C1_OUT_A", PinCapability::DigitalOut, &output_, err)) {
    return false;
  }
  board_.configureOutput(led_.gpio);
  board_.configureInput(input_.gpio, true);
  board_.configureOutput(output_.gpio);

  task_ = xTaskCreateStaticPinnedToCore(&Core1Task::taskEntry, "pinprobe_c1", kStackWords, this,
                                        1, stack_, &tcb_, 1);
  if (!task_) {
    return err.set(ErrorCode::CmdExec, "core 1 task create failed");
  }
  PINPROBE_LOGI("Core 1 >> Initialised");
  return true;
}

void Core1Task::taskEntry(void *arg) { static_cast<Core1Task *>(arg)->run(); }

void Core1Task::blink(uint16_t times, uint16_t intervalMs) {
  for (uint16_t i = 0; i < times; ++i) {
    board_.writePin(led_.gpio, true);
    vTaskDelay(pdMS_TO_TICKS(intervalMs));
    board_.writePin(led_.gpio, false);
    vTaskDelay(pdMS_TO_TICKS(intervalMs));
  }
}

void Core1Task::run() {
  for (;;) {
    CoreEvent event;
    while (queue_.dequeue(&event)) {
      switch (event.type) {
        case CoreEventType::Blink:
          blink(event.times, event.intervalMs);
          break;
      }
    }
    board_.writePin(output_.gpio, !board_.readPin(input_.gpio));
    vTaskDelay(pdMS_TO_TICKS(kIdleMs));
  }
}
