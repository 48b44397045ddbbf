#include "Tasklet.h"

Tasklet::Tasklet(uint32_t intervalMs, uint16_t runs, CountDown &countDown)
    : countDown_(countDown),
      intervalUs_(intervalMs * 1000U),
      initialRuns_(runs),
      remainingRuns_(runs),
      firstPoll_(true) {}

bool Tasklet::isReady() {
  if (firstPoll_) {
    firstPoll_ = false;
    countDown_.start(intervalUs_);
    if (initialRuns_ != 0) {
      remainingRuns_--;
      if (remainingRuns_ == 0) {
        countDown_.cancel();
      }
    }
    return true;
  }
  if (isExhausted()) {
    return false;
  }
  if (!countDown_.expired()) {
    return false;
  }
  if (initialRuns_ != 0) {
    remainingRuns_--;
    if (remainingRuns_ == 0) {
      countDown_.cancel();
    }
  }
  return true;
}

void Tasklet::reset() {
  remainingRuns_ = initialRuns_;
  countDown_.cancel();
  firstPoll_ = true;
}

void Tasklet::cancel() { countDown_.cancel(); }
