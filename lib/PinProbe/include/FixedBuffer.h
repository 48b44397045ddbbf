#pragma once

#include <stddef.h>
#include <stdint.h>
#include <string.h>

// Fixed-capacity FIFO of bytes. All operations saturate instead of failing; callers
// check isFull() before relying on a complete append.
template <size_t N>
class FixedBuffer {
 public:
  static_assert(N > 0, "FixedBuffer capacity must be > 0");

  static const size_t kCapacity = N;

  FixedBuffer() = default;

  bool isEmpty() const { return used_ == 0; }
  bool isFull() const { return used_ == N; }
  size_t size() const { return used_; }
  size_t capacity() const { return N; }
  size_t available() const { return N - used_; }
  void clear() { used_ = 0; }

  const uint8_t *data() const { return buffer_; }

  // Unused tail, for zero-copy fills. Commit with advance().
  uint8_t *receiveRegion() { return buffer_ + used_; }

  void advance(size_t n) {
    used_ = (n > available()) ? N : used_ + n;
  }

  void setEnd(size_t index) { used_ = (index > N) ? N : index; }

  bool addSingle(uint8_t byte) {
    if (isFull()) {
      return false;
    }
    buffer_[used_++] = byte;
    return true;
  }

  size_t append(const uint8_t *bytes, size_t len) {
    if (!bytes) {
      return 0;
    }
    const size_t count = (len < available()) ? len : available();
    if (count == 0) {
      return 0;
    }
    memcpy(buffer_ + used_, bytes, count);
    used_ += count;
    return count;
  }

  size_t append(const char *str) {
    if (!str) {
      return 0;
    }
    return append(static_cast<const uint8_t *>(static_cast<const void *>(str)), strlen(str));
  }

  void popFront(size_t n) {
    if (n > used_) {
      n = used_;
    }
    memmove(buffer_, buffer_ + n, used_ - n);
    used_ -= n;
  }

  size_t read(uint8_t *out, size_t len) {
    const size_t count = (len < used_) ? len : used_;
    if (!out || count == 0) {
      return 0;
    }
    memcpy(out, buffer_, count);
    popFront(count);
    return count;
  }

  bool readSingle(uint8_t *out) {
    if (isEmpty() || !out) {
      return false;
    }
    *out = buffer_[0];
    popFront(1);
    return true;
  }

  // Index of the first matching byte or -1.
  int contains(uint8_t byte) const {
    for (size_t i = 0; i < used_; ++i) {
      if (buffer_[i] == byte) {
        return static_cast<int>(i);
      }
    }
    return -1;
  }

  int containsSlice(const uint8_t *slice, size_t len) const {
    if (!slice || len == 0 || len > used_) {
      return -1;
    }
    for (size_t i = 0; i + len <= used_; ++i) {
      if (memcmp(buffer_ + i, slice, len) == 0) {
        return static_cast<int>(i);
      }
    }
    return -1;
  }

  int containsStr(const char *word) const {
    if (!word) {
      return -1;
    }
    const uint8_t *bytes = static_cast<const uint8_t *>(static_cast<const void *>(word));
    return containsSlice(bytes, strlen(word));
  }

 private:
  uint8_t buffer_[N];
  size_t used_ = 0;
};

template <size_t N>
const size_t FixedBuffer<N>::kCapacity;
