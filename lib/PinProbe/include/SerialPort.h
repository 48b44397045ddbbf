#pragma once

#include <stddef.h>
#include <stdint.h>

// Host-facing USB CDC endpoint. Implementations never block: read/write move what
// they can and return the count, or a negative value when the endpoint refuses.
class UsbSerialPort {
 public:
  virtual ~UsbSerialPort() {}

  // Services the device once. Returns true when data moved in either direction.
  virtual bool poll() = 0;
  virtual int read(uint8_t *out, size_t len) = 0;
  virtual int write(const uint8_t *data, size_t len) = 0;
  // Data Terminal Ready as reported by the host.
  virtual bool dtr() const = 0;
};

// Mutual exclusion between the main loop and the periodic service context.
class InterruptLock {
 public:
  virtual ~InterruptLock() {}

  virtual void lock() = 0;
  virtual bool tryLock() = 0;
  virtual void unlock() = 0;
};

class LockGuard {
 public:
  explicit LockGuard(InterruptLock &lock) : lock_(lock) { lock_.lock(); }
  ~LockGuard() { lock_.unlock(); }

  LockGuard(const LockGuard &) = delete;
  LockGuard &operator=(const LockGuard &) = delete;

 private:
  InterruptLock &lock_;
};

// Busy-wait source for the transport's retry spins.
class SpinDelay {
 public:
  virtual ~SpinDelay() {}

  virtual void delayMicros(uint32_t us) = 0;
};
