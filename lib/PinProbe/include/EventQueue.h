#pragma once

#include <stddef.h>
#include <stdint.h>

#include "SerialPort.h"

enum class CoreEventType : uint8_t {
  Blink,
};

struct CoreEvent {
  CoreEventType type;
  uint16_t times;
  uint16_t intervalMs;

  static CoreEvent blink(uint16_t times, uint16_t intervalMs) {
    CoreEvent ev = {CoreEventType::Blink, times, intervalMs};
    return ev;
  }
};

// Bounded FIFO shared between the two cores. Neither side ever waits: enqueue
// fails when full and dequeue fails when empty.
template <typename T, size_t N>
class EventQueue {
 public:
  explicit EventQueue(InterruptLock &lock) : lock_(lock) {}

  EventQueue(const EventQueue &) = delete;
  EventQueue &operator=(const EventQueue &) = delete;

  bool enqueue(const T &item) {
    LockGuard guard(lock_);
    if (count_ == N) {
      return false;
    }
    items_[(head_ + count_) % N] = item;
    count_++;
    return true;
  }

  bool dequeue(T *out) {
    LockGuard guard(lock_);
    if (count_ == 0) {
      return false;
    }
    *out = items_[head_];
    head_ = (head_ + 1) % N;
    count_--;
    return true;
  }

  size_t size() const {
    LockGuard guard(lock_);
    return count_;
  }

  static const size_t kCapacity = N;

 private:
  InterruptLock &lock_;
  T items_[N];
  size_t head_ = 0;
  size_t count_ = 0;
};

template <typename T, size_t N>
const size_t EventQueue<T, N>::kCapacity;
