#include "Device.h"

#include <math.h>

#include "ProbeLog.h"

float adcRawToVolts(uint16_t raw) {
  return static_cast<float>(raw) * kAdcRefVolts / static_cast<float>(kAdcMaxRaw);
}

float adcRawToOhms(uint16_t raw, uint32_t refOhms) {
  if (raw == 0) {
    return INFINITY;
  }
  const float x = static_cast<float>(kAdcMaxRaw) / static_cast<float>(raw) - 1.0f;
  return static_cast<float>(refOhms) * x;
}

Device::Device(Board &board, ByteTransport &transport, ResourceTable &pins, CountDown &countDown,
               CoreQueue &coreQueue)
    : board_(board), transport_(transport), pins_(pins), countDown_(countDown),
      coreQueue_(coreQueue) {
  for (size_t i = 0; i < kPwmSliceCount; ++i) {
    slices_[i].freqHz = 0;
    slices_[i].resolutionBits = 0;
    slices_[i].configured = false;
  }
}

bool Device::begin(ProbeError &err) {
  if (began_) {
    return err.set(ErrorCode::CmdExec, "device already started");
  }
  if (!claimGroup(PinGroup::Outputs, PinCapability::DigitalOut, err) ||
      !claimGroup(PinGroup::Inputs, PinCapability::DigitalIn, err) ||
      !claimGroup(PinGroup::Pwm, PinCapability::Pwm, err) ||
      !claimGroup(PinGroup::Adc, PinCapability::Adc, err)) {
    return false;
  }
  began_ = true;
  PINPROBE_LOGD("device ready: %u outputs, %u inputs, %u pwm, %u adc",
                static_cast<unsigned>(outputs_.size()), static_cast<unsigned>(inputs_.size()),
                static_cast<unsigned>(pwms_.size()), static_cast<unsigned>(adcs_.size()));
  return true;
}

bool Device::claimGroup(PinGroup group, PinCapability capability, ProbeError &err) {
  uint8_t ids[kMaxPins];
  const size_t count = pins_.groupPins(group, ids, kMaxPins);
  for (size_t i = 0; i < count; ++i) {
    PinHandle handle;
    if (!pins_.claim(ids[i], capability, &handle, err)) {
      return false;
    }
    bool added = false;
    switch (capability) {
      case PinCapability::DigitalOut: {
        board_.configureOutput(handle.gpio);
        board_.writePin(handle.gpio, false);
        DigitalPin pin = {handle, false};
        added = outputs_.add(pin);
        break;
      }
      case PinCapability::DigitalIn: {
        board_.configureInput(handle.gpio, true);
        DigitalPin pin = {handle, false};
        added = inputs_.add(pin);
        break;
      }
      case PinCapability::Pwm: {
        const uint8_t channel = static_cast<uint8_t>(pwms_.size());
        PwmOutput pwm = {handle, channel, static_cast<uint8_t>(channel / 2), false};
        if (channel >= kMaxPwmChannels) {
          break;
        }
        if (!configurePwm(pwm, kPwmDefaultFreqHz, 0, err) ||
            !board_.pwmAttach(pwm.channel, pwm.slice, handle.gpio, err)) {
          return false;
        }
        added = pwms_.add(pwm);
        break;
      }
      case PinCapability::Adc: {
        board_.configureAdc(handle.gpio);
        AdcInput adc = {handle};
        added = adcs_.add(adc);
        break;
      }
      default:
        break;
    }
    if (!added) {
      return err.set(ErrorCode::CmdExec, "too many %s pins", pinGroupName(group));
    }
    PINPROBE_LOGT("gpio %u (%s) -> %s", static_cast<unsigned>(handle.gpio), handle.alias,
                  pinCapabilityName(capability));
  }
  return true;
}

void Device::writeOutput(DigitalPin &pin, bool high) {
  board_.writePin(pin.handle.gpio, high);
  pin.level = high;
}

bool Device::readInput(const DigitalPin &pin) { return board_.readPin(pin.handle.gpio); }

bool Device::readAdcChannel(uint8_t channel, uint16_t *raw) {
  if (channel >= adcs_.size()) {
    return false;
  }
  *raw = board_.readAdc(adcs_.at(channel).handle.gpio);
  return true;
}

bool Device::configurePwm(PwmOutput &pwm, uint32_t freqHz, uint32_t top, ProbeError &err) {
  if (freqHz == 0 || freqHz > kPwmSourceClockHz / 2) {
    return err.set(ErrorCode::CmdExec, "freq %u out of range", static_cast<unsigned>(freqHz));
  }
  uint8_t bits = 1;
  while (bits < kPwmMaxResolutionBits &&
         (static_cast<uint64_t>(freqHz) << (bits + 1)) <= kPwmSourceClockHz) {
    bits++;
  }
  if (top > 0) {
    uint8_t needed = 1;
    while (needed < 32 && ((static_cast<uint64_t>(1) << needed) - 1) < top) {
      needed++;
    }
    if (needed < bits) {
      bits = needed;
    }
  }
  PwmSlice &slice = slices_[pwm.slice];
  if (slice.configured && slice.freqHz == freqHz && slice.resolutionBits == bits) {
    return true;
  }
  if (!board_.pwmConfigureSlice(pwm.slice, freqHz, bits, err)) {
    return false;
  }
  slice.freqHz = freqHz;
  slice.resolutionBits = bits;
  slice.configured = true;
  return true;
}

uint32_t Device::pwmFullScale(const PwmOutput &pwm) const {
  return static_cast<uint32_t>(1) << slices_[pwm.slice].resolutionBits;
}

void Device::applyPwmDuty(PwmOutput &pwm, uint32_t duty, bool centred) {
  const uint32_t full = pwmFullScale(pwm);
  if (duty > full) {
    duty = full;
  }
  const uint32_t hpoint = centred ? (full - duty) / 2 : 0;
  board_.pwmWrite(pwm.channel, duty, hpoint);
  pwm.enabled = true;
}

void Device::setPwmDutyPercent(PwmOutput &pwm, uint8_t percent, bool centred) {
  if (percent > 100) {
    percent = 100;
  }
  const uint32_t duty = static_cast<uint32_t>(
      static_cast<uint64_t>(pwmFullScale(pwm)) * percent / 100U);
  applyPwmDuty(pwm, duty, centred);
}

void Device::setPwmDutyUs(PwmOutput &pwm, uint32_t us, bool centred) {
  const uint32_t freqHz = slices_[pwm.slice].freqHz;
  const uint32_t full = pwmFullScale(pwm);
  const uint32_t periodUs = freqHz > 0 ? 1000000UL / freqHz : 0;
  uint32_t duty = 0;
  if (periodUs == 0 || us >= periodUs) {
    duty = full;
  } else {
    duty = static_cast<uint32_t>(static_cast<uint64_t>(us) * freqHz * full / 1000000ULL);
  }
  applyPwmDuty(pwm, duty, centred);
}

void Device::disablePwm(PwmOutput &pwm) {
  board_.pwmStop(pwm.channel);
  pwm.enabled = false;
}

bool Device::ensureI2c(ProbeError &err) {
  if (i2cReady_) {
    return true;
  }
  uint8_t sda = 0;
  uint8_t scl = 0;
  if (!pins_.getGpio("I2C0_SDA", &sda, err) || !pins_.getGpio("I2C0_SCL", &scl, err)) {
    return false;
  }
  if (!pins_.claim(sda, PinCapability::I2c, nullptr, err) ||
      !pins_.claim(scl, PinCapability::I2c, nullptr, err)) {
    return false;
  }
  if (!board_.i2cBegin(sda, scl, kI2cScanFreqHz, err)) {
    return false;
  }
  i2cReady_ = true;
  PINPROBE_LOGD("i2c up on sda=%u scl=%u", static_cast<unsigned>(sda),
                static_cast<unsigned>(scl));
  return true;
}

bool Device::ensureSpi(ProbeError &err) {
  if (spiReady_) {
    return true;
  }
  uint8_t sck = 0;
  uint8_t miso = 0;
  uint8_t mosi = 0;
  uint8_t cs = 0;
  if (!pins_.getGpio("SPI0_SCK", &sck, err) || !pins_.getGpio("SPI0_MISO", &miso, err) ||
      !pins_.getGpio("SPI0_MOSI", &mosi, err) || !pins_.getGpio("SPI0_CS", &cs, err)) {
    return false;
  }
  if (!pins_.claim(sck, PinCapability::Spi, nullptr, err) ||
      !pins_.claim(miso, PinCapability::Spi, nullptr, err) ||
      !pins_.claim(mosi, PinCapability::Spi, nullptr, err) ||
      !pins_.claim(cs, PinCapability::Spi, nullptr, err)) {
    return false;
  }
  if (!board_.spiBegin(sck, miso, mosi, cs, err)) {
    return false;
  }
  board_.configureOutput(cs);
  board_.writePin(cs, true);
  spiCs_ = cs;
  spiReady_ = true;
  PINPROBE_LOGD("spi up on sck=%u miso=%u mosi=%u cs=%u", static_cast<unsigned>(sck),
                static_cast<unsigned>(miso), static_cast<unsigned>(mosi),
                static_cast<unsigned>(cs));
  return true;
}

bool Device::cancelRequested() {
  transport_.pollForInterruptChar();
  return transport_.interruptTriggered() || !transport_.isConnected();
}

bool Device::waitMs(uint32_t ms) {
  while (ms > 0) {
    if (cancelRequested()) {
      return false;
    }
    const uint32_t slice = ms < kServicePeriodMs ? ms : kServicePeriodMs;
    board_.delayMs(slice);
    ms -= slice;
  }
  return !cancelRequested();
}
