#include "ByteTransport.h"

#include <stdarg.h>
#include <stdio.h>
#include <string.h>

static const char kTruncatedMarker[] = "[truncated]\r\n";

static bool storeLineByte(uint8_t *out, size_t cap, size_t *used, uint8_t byte) {
  if (*used >= cap) {
    return false;
  }
  out[(*used)++] = byte;
  return true;
}

ByteTransport::ByteTransport(UsbSerialPort &port, InterruptLock &lock, SpinDelay &delay)
    : port_(port), lock_(lock), delay_(delay), interrupted_(false), interruptArmed_(false),
      droppedWrites_(0) {}

bool ByteTransport::pollLocked() {
  const bool moved = port_.poll();
  drainLocked();
  return moved;
}

void ByteTransport::drainLocked() {
  if (writeBuffer_.isEmpty()) {
    return;
  }
  const int sent = port_.write(writeBuffer_.data(), writeBuffer_.size());
  if (sent > 0) {
    writeBuffer_.popFront(static_cast<size_t>(sent));
  }
}

void ByteTransport::discardRxLocked() {
  uint8_t scratch[kScanChunk];
  int emptyReads = 0;
  for (int reads = 0; reads < kMaxDiscardReads * 8 && emptyReads < kMaxDiscardReads; ++reads) {
    port_.poll();
    if (port_.read(scratch, sizeof(scratch)) > 0) {
      emptyReads = 0;
    } else {
      emptyReads++;
    }
  }
}

bool ByteTransport::poll() {
  LockGuard guard(lock_);
  return pollLocked();
}

bool ByteTransport::isConnected() const {
  LockGuard guard(lock_);
  return port_.dtr();
}

bool ByteTransport::write(const uint8_t *data, size_t len, ProbeError &err) {
  if (!data && len > 0) {
    return err.set(ErrorCode::WouldBlock, "null write");
  }
  size_t sent = 0;
  size_t pendingAfter = 0;
  uint32_t spins = 0;
  for (;;) {
    bool connected = false;
    bool progressed = false;
    bool done = false;
    {
      LockGuard guard(lock_);
      connected = port_.dtr();
      if (connected) {
        const size_t appended = writeBuffer_.append(data + sent, len - sent);
        sent += appended;
        const size_t pending = writeBuffer_.size();
        port_.poll();
        drainLocked();
        pendingAfter = writeBuffer_.size();
        progressed = appended > 0 || pendingAfter < pending;
        done = sent == len && pendingAfter == 0;
      } else {
        writeBuffer_.clear();
      }
    }
    if (!connected) {
      return err.set(ErrorCode::Disconnected, "host closed the port");
    }
    if (done) {
      return true;
    }
    if (progressed) {
      spins = 0;
      continue;
    }
    if (++spins >= kWriteSpinLimit) {
      return err.set(ErrorCode::WouldBlock, "%u bytes pending",
                     static_cast<unsigned>(len - sent + pendingAfter));
    }
    delay_.delayMicros(kRetryDelayUs);
  }
}

bool ByteTransport::write(const char *str, ProbeError &err) {
  if (!str) {
    return true;
  }
  return write(static_cast<const uint8_t *>(static_cast<const void *>(str)), strlen(str), err);
}

bool ByteTransport::flush(ProbeError &err) {
  return write(static_cast<const uint8_t *>(nullptr), 0, err);
}

bool ByteTransport::readLineBlocking(uint8_t *out, size_t cap, size_t *len, ProbeError &err) {
  if (len) {
    *len = 0;
  }
  if (!out || !len) {
    return err.set(ErrorCode::BufferOverflow, "no line buffer");
  }
  if (!isConnected()) {
    return err.set(ErrorCode::InvalidEndpoint, "host not connected");
  }
  size_t used = 0;
  bool overflow = false;
  bool pendingCr = false;
  for (;;) {
    uint8_t byte = 0;
    int got = 0;
    bool connected = false;
    {
      LockGuard guard(lock_);
      pollLocked();
      connected = port_.dtr();
      if (connected) {
        got = port_.read(&byte, 1);
      }
    }
    if (!connected) {
      return err.set(ErrorCode::InvalidEndpoint, "host disconnected mid-line");
    }
    if (got <= 0) {
      delay_.delayMicros(kRetryDelayUs);
      continue;
    }
    if (byte == '\n') {
      break;
    }
    if (byte == kInterruptChar || byte == kCtrlC || overflow) {
      continue;
    }
    // A '\r' is only stored once something other than '\n' follows it.
    if (pendingCr) {
      pendingCr = false;
      if (!storeLineByte(out, cap, &used, '\r')) {
        overflow = true;
        continue;
      }
    }
    if (byte == '\r') {
      pendingCr = true;
      continue;
    }
    if (!storeLineByte(out, cap, &used, byte)) {
      overflow = true;
    }
  }
  if (overflow) {
    *len = used;
    return err.set(ErrorCode::BufferOverflow, "line longer than %u bytes",
                   static_cast<unsigned>(cap));
  }
  *len = used;
  return true;
}

void ByteTransport::pollForInterruptChar() {
  if (!lock_.tryLock()) {
    return;
  }
  port_.poll();
  drainLocked();
  if (interruptArmed_.load() && !interrupted_.load()) {
    uint8_t chunk[kScanChunk];
    const int count = port_.read(chunk, sizeof(chunk));
    for (int i = 0; i < count; ++i) {
      if (chunk[i] == kInterruptChar || chunk[i] == kCtrlC) {
        interrupted_.store(true);
        discardRxLocked();
        break;
      }
    }
  }
  lock_.unlock();
}

void ByteTransport::clearInterrupt() {
  interrupted_.store(false);
  interruptArmed_.store(true);
}

void ByteTransport::disarmInterrupt() { interruptArmed_.store(false); }

void ByteTransport::writeOrCount(const char *str, size_t len) {
  ProbeError err;
  if (!write(static_cast<const uint8_t *>(static_cast<const void *>(str)), len, err)) {
    droppedWrites_.fetch_add(1);
  }
}

void ByteTransport::print(const char *str) {
  if (str) {
    writeOrCount(str, strlen(str));
  }
}

void ByteTransport::println(const char *str) {
  print(str);
  writeOrCount("\r\n", 2);
}

void ByteTransport::printf(const char *fmt, ...) {
  char line[kWriteBufferSize];
  va_list args;
  va_start(args, fmt);
  const int n = vsnprintf(line, sizeof(line), fmt, args);
  va_end(args);
  if (n < 0) {
    droppedWrites_.fetch_add(1);
    return;
  }
  const size_t len = strlen(line);
  writeOrCount(line, len);
  if (static_cast<size_t>(n) >= sizeof(line)) {
    writeOrCount(kTruncatedMarker, sizeof(kTruncatedMarker) - 1);
  }
}
