#pragma once

#include <stdint.h>

// Periodic hardware countdown. Once started, expired() reports each elapsed
// period exactly once and the next period begins immediately.
class CountDown {
 public:
  virtual ~CountDown() {}

  virtual void start(uint32_t periodUs) = 0;
  virtual bool expired() = 0;
  virtual void cancel() = 0;
};

// Non-blocking periodic task for in-loop use.
//
//   Tasklet ledTask(interval, times * 2, countDown);
//   while (!ledTask.isExhausted()) {
//     if (ledTask.isReady()) {
//       board.toggle(led);
//     }
//   }
class Tasklet {
 public:
  // runs == 0 means unlimited.
  Tasklet(uint32_t intervalMs, uint16_t runs, CountDown &countDown);

  // True on the very first poll and then once per elapsed interval.
  bool isReady();
  bool isExhausted() const { return initialRuns_ != 0 && remainingRuns_ == 0; }
  void reset();
  void cancel();

 private:
  CountDown &countDown_;
  uint32_t intervalUs_;
  uint16_t initialRuns_;
  uint16_t remainingRuns_;
  bool firstPoll_;
};
