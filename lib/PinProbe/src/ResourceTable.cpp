#include "ResourceTable.h"

#include "CommandParser.h"

const char *pinGroupName(PinGroup group) {
  switch (group) {
    case PinGroup::Reserved:
      return "Reserved";
    case PinGroup::Adc:
      return "Adc";
    case PinGroup::Pwm:
      return "Pwm";
    case PinGroup::I2c:
      return "I2c";
    case PinGroup::Spi:
      return "Spi";
    case PinGroup::Uart:
      return "Uart";
    case PinGroup::Inputs:
      return "Inputs";
    case PinGroup::Outputs:
      return "Outputs";
    case PinGroup::Other:
      return "Other";
    case PinGroup::C1Adc:
      return "C1_Adc";
    case PinGroup::C1Pwm:
      return "C1_Pwm";
    case PinGroup::C1I2c:
      return "C1_I2c";
    case PinGroup::C1Spi:
      return "C1_Spi";
    case PinGroup::C1Uart:
      return "C1_Uart";
    case PinGroup::C1Inputs:
      return "C1_Inputs";
    case PinGroup::C1Outputs:
      return "C1_Outputs";
  }
  return "unknown";
}

const char *pinCapabilityName(PinCapability capability) {
  switch (capability) {
    case PinCapability::Raw:
      return "raw";
    case PinCapability::Adc:
      return "adc";
    case PinCapability::Pwm:
      return "pwm";
    case PinCapability::DigitalIn:
      return "input";
    case PinCapability::DigitalOut:
      return "output";
    case PinCapability::I2c:
      return "i2c";
    case PinCapability::Spi:
      return "spi";
    case PinCapability::Uart:
      return "uart";
  }
  return "unknown";
}

ResourceTable::ResourceTable(const PinDef *defs, size_t count) {
  bool seen[kGpioCount] = {false};
  for (size_t i = 0; i < count; ++i) {
    const PinDef &def = defs[i];
    if (def.id == kPinNotAssigned) {
      continue;
    }
    if (def.id >= kGpioCount) {
      probeFatal("pin out of bounds: %u (%s)", static_cast<unsigned>(def.id), def.alias);
    }
    if (seen[def.id]) {
      probeFatal("duplicate config pin: %u (%s)", static_cast<unsigned>(def.id), def.alias);
    }
    seen[def.id] = true;
    if (count_ >= kMaxPins) {
      probeFatal("pin table exceeds %u entries", static_cast<unsigned>(kMaxPins));
    }
    entries_[count_].def = def;
    entries_[count_].taken.store(false);
    count_++;
  }
}

int ResourceTable::indexOf(uint8_t id) const {
  for (size_t i = 0; i < count_; ++i) {
    if (entries_[i].def.id == id) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

int ResourceTable::indexOfAlias(const char *alias) const {
  if (!alias) {
    return -1;
  }
  for (size_t i = 0; i < count_; ++i) {
    if (equalsIgnoreCase(entries_[i].def.alias, alias)) {
      return static_cast<int>(i);
    }
  }
  return -1;
}

bool ResourceTable::getGpio(const char *alias, uint8_t *id, ProbeError &err) const {
  const int idx = indexOfAlias(alias);
  if (idx < 0) {
    return err.set(ErrorCode::AliasNotFound, "%s", alias ? alias : "(none)");
  }
  *id = entries_[idx].def.id;
  return true;
}

bool ResourceTable::getAlias(uint8_t id, const char **alias, ProbeError &err) const {
  const int idx = indexOf(id);
  if (idx < 0) {
    return err.set(ErrorCode::GpioNotFound, "gpio %u", static_cast<unsigned>(id));
  }
  *alias = entries_[idx].def.alias;
  return true;
}

bool ResourceTable::getGroup(uint8_t id, PinGroup *group) const {
  const int idx = indexOf(id);
  if (idx < 0) {
    return false;
  }
  *group = entries_[idx].def.group;
  return true;
}

bool ResourceTable::getGpioAliasPair(bool hasId, uint8_t id, const char *alias, uint8_t *outId,
                                     const char **outAlias, ProbeError &err) const {
  if (hasId) {
    if (!getAlias(id, outAlias, err)) {
      return false;
    }
    *outId = id;
    return true;
  }
  if (alias) {
    const int idx = indexOfAlias(alias);
    if (idx < 0) {
      return err.set(ErrorCode::AliasNotFound, "%s", alias);
    }
    *outId = entries_[idx].def.id;
    *outAlias = entries_[idx].def.alias;
    return true;
  }
  return err.set(ErrorCode::GpioNotFound, "no gpio or alias given");
}

bool ResourceTable::claim(uint8_t id, PinCapability capability, PinHandle *handle,
                          ProbeError &err) {
  const int idx = indexOf(id);
  if (idx < 0) {
    return err.set(ErrorCode::GpioNotFound, "gpio %u", static_cast<unsigned>(id));
  }
  Entry &entry = entries_[idx];
  bool expected = false;
  if (!entry.taken.compare_exchange_strong(expected, true)) {
    return err.set(ErrorCode::PinAlreadyConfigured, "gpio %u (%s)", static_cast<unsigned>(id),
                   entry.def.alias);
  }
  if (handle) {
    handle->gpio = id;
    handle->capability = capability;
    handle->alias = entry.def.alias;
  }
  return true;
}

bool ResourceTable::claimByAlias(const char *alias, PinCapability capability, PinHandle *handle,
                                 ProbeError &err) {
  uint8_t id = 0;
  if (!getGpio(alias, &id, err)) {
    return false;
  }
  return claim(id, capability, handle, err);
}

bool ResourceTable::isClaimed(uint8_t id) const {
  const int idx = indexOf(id);
  return idx >= 0 && entries_[idx].taken.load();
}

size_t ResourceTable::groupPins(PinGroup group, uint8_t *ids, size_t maxIds) const {
  size_t n = 0;
  for (size_t i = 0; i < count_ && n < maxIds; ++i) {
    if (entries_[i].def.group == group) {
      ids[n++] = entries_[i].def.id;
    }
  }
  return n;
}
