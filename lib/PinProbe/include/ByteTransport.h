#pragma once

#include <atomic>

#include "FixedBuffer.h"
#include "ProbeConfig.h"
#include "ProbeError.h"
#include "SerialPort.h"

// Owns the USB serial endpoint and its write buffer. Every access to the port,
// the buffer or the DTR flag happens under lock_, from the main loop and from the
// periodic service context alike. Blocking calls take the lock per iteration.
class ByteTransport {
 public:
  ByteTransport(UsbSerialPort &port, InterruptLock &lock, SpinDelay &delay);

  ByteTransport(const ByteTransport &) = delete;
  ByteTransport &operator=(const ByteTransport &) = delete;

  // Must run at least every 10 ms to keep the CDC link alive.
  bool poll();
  bool isConnected() const;

  bool write(const uint8_t *data, size_t len, ProbeError &err);
  bool write(const char *str, ProbeError &err);
  bool flush(ProbeError &err);

  // Reads one '\n' terminated line into out (terminator and trailing '\r' stripped).
  // On BufferOverflow the rest of the line has already been consumed and discarded.
  bool readLineBlocking(uint8_t *out, size_t cap, size_t *len, ProbeError &err);

  // Service context only. Scans received bytes for the break character while a
  // cancellable command has armed it via clearInterrupt().
  void pollForInterruptChar();
  void clearInterrupt();
  void disarmInterrupt();
  bool interruptTriggered() const { return interrupted_.load(); }

  void print(const char *str);
  void println(const char *str = "");
  void printf(const char *fmt, ...) __attribute__((format(printf, 2, 3)));

  uint32_t droppedWrites() const { return droppedWrites_.load(); }

 private:
  static const uint32_t kRetryDelayUs = 5;
  static const size_t kScanChunk = 64;
  static const int kMaxDiscardReads = 20;

  bool pollLocked();
  void drainLocked();
  void discardRxLocked();
  void writeOrCount(const char *str, size_t len);

  UsbSerialPort &port_;
  InterruptLock &lock_;
  SpinDelay &delay_;
  FixedBuffer<kWriteBufferSize> writeBuffer_;
  std::atomic<bool> interrupted_;
  std::atomic<bool> interruptArmed_;
  std::atomic<uint32_t> droppedWrites_;
};
