#pragma once

#include <stddef.h>
#include <stdint.h>

#include "Board.h"
#include "ByteTransport.h"
#include "CommandParser.h"
#include "EventQueue.h"
#include "ProbeConfig.h"
#include "ProbeError.h"
#include "ResourceTable.h"
#include "Tasklet.h"

static const size_t kMaxGroupPins = 12;
static const size_t kMaxPwmChannels = 8;
static const size_t kPwmSliceCount = kMaxPwmChannels / 2;

struct DigitalPin {
  PinHandle handle;
  bool level;
};

struct PwmOutput {
  PinHandle handle;
  uint8_t channel;
  uint8_t slice;
  bool enabled;
};

struct PwmSlice {
  uint32_t freqHz;
  uint8_t resolutionBits;
  bool configured;
};

struct AdcInput {
  PinHandle handle;
};

typedef EventQueue<CoreEvent, kEventQueueDepth> CoreQueue;

// Claimed pins of one kind, in pin table order.
template <typename T, size_t N>
class PinList {
 public:
  bool add(const T &item) {
    if (count_ >= N) {
      return false;
    }
    items_[count_++] = item;
    return true;
  }

  T *find(uint8_t gpio) {
    for (size_t i = 0; i < count_; ++i) {
      if (items_[i].handle.gpio == gpio) {
        return &items_[i];
      }
    }
    return nullptr;
  }

  T *findByAlias(const char *alias) {
    for (size_t i = 0; i < count_; ++i) {
      if (equalsIgnoreCase(items_[i].handle.alias, alias)) {
        return &items_[i];
      }
    }
    return nullptr;
  }

  int indexOf(uint8_t gpio) const {
    for (size_t i = 0; i < count_; ++i) {
      if (items_[i].handle.gpio == gpio) {
        return static_cast<int>(i);
      }
    }
    return -1;
  }

  size_t size() const { return count_; }
  T &at(size_t index) { return items_[index]; }
  const T &at(size_t index) const { return items_[index]; }

 private:
  T items_[N];
  size_t count_ = 0;
};

float adcRawToVolts(uint16_t raw);
// Resistance of the lower leg of a divider with refOhms as the pull-up.
float adcRawToOhms(uint16_t raw, uint32_t refOhms);

// Everything a command handler may touch. Built once at startup.
class Device {
 public:
  Device(Board &board, ByteTransport &transport, ResourceTable &pins, CountDown &countDown,
         CoreQueue &coreQueue);

  Device(const Device &) = delete;
  Device &operator=(const Device &) = delete;

  // Walks the pin table group by group and claims every output, input, PWM and
  // ADC pin. Core 1 and bus pins are left for their owners to claim.
  bool begin(ProbeError &err);

  Board &board() { return board_; }
  ByteTransport &transport() { return transport_; }
  ResourceTable &pins() { return pins_; }
  CountDown &countDown() { return countDown_; }
  CoreQueue &coreQueue() { return coreQueue_; }

  PinList<DigitalPin, kMaxGroupPins> &outputs() { return outputs_; }
  PinList<DigitalPin, kMaxGroupPins> &inputs() { return inputs_; }
  PinList<PwmOutput, kMaxPwmChannels> &pwms() { return pwms_; }
  PinList<AdcInput, kMaxGroupPins> &adcs() { return adcs_; }
  const PwmSlice &pwmSlice(uint8_t slice) const { return slices_[slice]; }

  DigitalPin *statusLed() { return outputs_.findByAlias("LED"); }
  void writeOutput(DigitalPin &pin, bool high);
  bool readInput(const DigitalPin &pin);
  bool readAdcChannel(uint8_t channel, uint16_t *raw);

  // Changing the frequency or top of a slice re-times both of its channels.
  bool configurePwm(PwmOutput &pwm, uint32_t freqHz, uint32_t top, ProbeError &err);
  void setPwmDutyPercent(PwmOutput &pwm, uint8_t percent, bool centred);
  void setPwmDutyUs(PwmOutput &pwm, uint32_t us, bool centred);
  void disablePwm(PwmOutput &pwm);
  uint32_t pwmFullScale(const PwmOutput &pwm) const;

  // Bus pins are claimed on first use and stay with the bus afterwards.
  bool ensureI2c(ProbeError &err);
  bool ensureSpi(ProbeError &err);
  uint8_t spiCsPin() const { return spiCs_; }

  // Services the interrupt scan from the calling loop as well, so a cancellable
  // command stops even when the periodic service context is late.
  bool cancelRequested();
  // Sleeps in service-period slices. Returns false as soon as a cancel arrives.
  bool waitMs(uint32_t ms);

 private:
  bool claimGroup(PinGroup group, PinCapability capability, ProbeError &err);
  void applyPwmDuty(PwmOutput &pwm, uint32_t duty, bool centred);

  Board &board_;
  ByteTransport &transport_;
  ResourceTable &pins_;
  CountDown &countDown_;
  CoreQueue &coreQueue_;

  PinList<DigitalPin, kMaxGroupPins> outputs_;
  PinList<DigitalPin, kMaxGroupPins> inputs_;
  PinList<PwmOutput, kMaxPwmChannels> pwms_;
  PinList<AdcInput, kMaxGroupPins> adcs_;
  PwmSlice slices_[kPwmSliceCount];

  bool began_ = false;
  bool i2cReady_ = false;
  bool spiReady_ = false;
  uint8_t spiCs_ = kPinNotAssigned;
};

static const uint32_t kPwmDefaultFreqHz = 50;
static const uint32_t kI2cScanFreqHz = 100000;
