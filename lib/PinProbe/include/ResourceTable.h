#pragma once

#include <atomic>
#include <stddef.h>
#include <stdint.h>

#include "ProbeConfig.h"
#include "ProbeError.h"

enum class PinGroup : uint8_t {
  Reserved,
  Adc,
  Pwm,
  I2c,
  Spi,
  Uart,
  Inputs,
  Outputs,
  Other,
  C1Adc,
  C1Pwm,
  C1I2c,
  C1Spi,
  C1Uart,
  C1Inputs,
  C1Outputs,
};

// What a claimed pin is driven as. Fixed once at claim time.
enum class PinCapability : uint8_t {
  Raw,
  Adc,
  Pwm,
  DigitalIn,
  DigitalOut,
  I2c,
  Spi,
  Uart,
};

const char *pinGroupName(PinGroup group);
const char *pinCapabilityName(PinCapability capability);

static const uint8_t kPinNotAssigned = 0xFF;

struct PinDef {
  const char *alias;
  uint8_t id;
  PinGroup group;
};

struct PinHandle {
  uint8_t gpio;
  PinCapability capability;
  const char *alias;
};

class ResourceTable {
 public:
  // Placeholder entries are dropped. A duplicate or out-of-range GPIO is a build
  // configuration error and halts through probeFatal().
  ResourceTable(const PinDef *defs, size_t count);

  ResourceTable(const ResourceTable &) = delete;
  ResourceTable &operator=(const ResourceTable &) = delete;

  size_t size() const { return count_; }
  const PinDef &at(size_t index) const { return entries_[index].def; }

  bool getGpio(const char *alias, uint8_t *id, ProbeError &err) const;
  bool getAlias(uint8_t id, const char **alias, ProbeError &err) const;
  bool getGroup(uint8_t id, PinGroup *group) const;
  // An explicit id wins over the alias.
  bool getGpioAliasPair(bool hasId, uint8_t id, const char *alias, uint8_t *outId,
                        const char **outAlias, ProbeError &err) const;

  // Sole admission point for driving a pin. Claims last for the process lifetime.
  bool claim(uint8_t id, PinCapability capability, PinHandle *handle, ProbeError &err);
  bool claimByAlias(const char *alias, PinCapability capability, PinHandle *handle,
                    ProbeError &err);
  bool isClaimed(uint8_t id) const;

  // Fills ids with the GPIOs of one group in table order. Returns how many were written.
  size_t groupPins(PinGroup group, uint8_t *ids, size_t maxIds) const;

 private:
  struct Entry {
    PinDef def;
    std::atomic<bool> taken;
  };

  int indexOf(uint8_t id) const;
  int indexOfAlias(const char *alias) const;

  Entry entries_[kMaxPins];
  size_t count_ = 0;
};
