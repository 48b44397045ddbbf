#pragma once

#include <atomic>

#include "CommandRegistry.h"
#include "Device.h"
#include "FixedBuffer.h"
#include "ProbeConfig.h"

// The console application: waits for a host, reads one command line at a time,
// runs it and reports how long it took. Only one may be started per process.
class PinProbe {
 public:
  PinProbe(Device &device, const CommandRegistry &registry);
  ~PinProbe();

  PinProbe(const PinProbe &) = delete;
  PinProbe &operator=(const PinProbe &) = delete;

  void begin();
  // One prompt cycle. Returns without blocking when no host is connected.
  void update();

  // Runs a single line as if the host had typed it.
  void runLine(const char *line);

 private:
  void greet();
  void reportError(const ProbeError &err);

  Device &device_;
  Dispatcher dispatcher_;
  FixedBuffer<kLineBufferSize + 1> lineBuffer_;
  bool started_ = false;
  bool greeted_ = false;

  static std::atomic<bool> sLive;
};
