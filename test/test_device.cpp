#include <gtest/gtest.h>

#include <cmath>

#include "FakeHardware.h"

class DeviceTest : public ::testing::Test {
 protected:
  ProbeRig rig;
};

struct ClaimCase {
  const char *alias;
  PinCapability capability;
};

TEST_F(DeviceTest, BeginClaimsEveryCore0Group) {
  ASSERT_TRUE(rig.begin());
  const ClaimCase cases[] = {
      {"LED", PinCapability::DigitalOut},   {"OUT_A", PinCapability::DigitalOut},
      {"OUT_B", PinCapability::DigitalOut}, {"BUTTON", PinCapability::DigitalIn},
      {"IN_A", PinCapability::DigitalIn},   {"IN_B", PinCapability::DigitalIn},
      {"PWM0_A", PinCapability::Pwm},       {"PWM1_B", PinCapability::Pwm},
      {"ADC0", PinCapability::Adc},         {"ADC3", PinCapability::Adc},
  };
  for (size_t i = 0; i < sizeof(cases) / sizeof(cases[0]); ++i) {
    uint8_t id = 0;
    ProbeError err;
    ASSERT_TRUE(rig.pins.getGpio(cases[i].alias, &id, err));
    EXPECT_TRUE(rig.pins.isClaimed(id)) << cases[i].alias;
  }
  EXPECT_EQ(3u, rig.device.outputs().size());
  EXPECT_EQ(3u, rig.device.inputs().size());
  EXPECT_EQ(4u, rig.device.pwms().size());
  EXPECT_EQ(4u, rig.device.adcs().size());
}

TEST_F(DeviceTest, BeginLeavesBusCore1AndReservedPinsFree) {
  ASSERT_TRUE(rig.begin());
  const char *const unclaimed[] = {"USB_DM", "I2C0_SDA", "SPI0_CS",
                                   "UART1_TX", "C1_IN_A", "C1_LED"};
  for (size_t i = 0; i < sizeof(unclaimed) / sizeof(unclaimed[0]); ++i) {
    uint8_t id = 0;
    ProbeError err;
    ASSERT_TRUE(rig.pins.getGpio(unclaimed[i], &id, err));
    EXPECT_FALSE(rig.pins.isClaimed(id)) << unclaimed[i];
  }
}

TEST_F(DeviceTest, BeginConfiguresHardware) {
  ASSERT_TRUE(rig.begin());
  EXPECT_TRUE(rig.board.isOutput[2]);
  EXPECT_FALSE(rig.board.level[2]);
  EXPECT_TRUE(rig.board.isInput[14]);
  EXPECT_TRUE(rig.board.pullUp[14]);
  EXPECT_TRUE(rig.board.isAdc[1]);
  EXPECT_EQ(6, rig.board.channelGpio[0]);
  EXPECT_EQ(16, rig.board.channelGpio[3]);
  EXPECT_EQ(1, rig.board.channelSlice[3]);
  EXPECT_EQ(2u, rig.board.sliceConfigs);
  EXPECT_EQ(50u, rig.board.sliceFreq[0]);
}

TEST_F(DeviceTest, BeginTwiceFails) {
  ASSERT_TRUE(rig.begin());
  ProbeError err;
  EXPECT_FALSE(rig.device.begin(err));
  EXPECT_EQ(ErrorCode::CmdExec, err.code);
}

TEST_F(DeviceTest, BeginFailsWhenAPinIsAlreadyTaken) {
  ProbeError err;
  ASSERT_TRUE(rig.pins.claimByAlias("IN_A", PinCapability::Raw, nullptr, err));
  EXPECT_FALSE(rig.device.begin(err));
  EXPECT_EQ(ErrorCode::PinAlreadyConfigured, err.code);
}

TEST_F(DeviceTest, BeginPropagatesPwmFailure) {
  rig.board.failPwm = true;
  ProbeError err;
  EXPECT_FALSE(rig.device.begin(err));
  EXPECT_EQ(ErrorCode::CmdExec, err.code);
}

TEST(DeviceAdcTest, RawConversions) {
  EXPECT_FLOAT_EQ(0.0f, adcRawToVolts(0));
  EXPECT_FLOAT_EQ(3.3f, adcRawToVolts(4095));
  EXPECT_NEAR(1.65f, adcRawToVolts(2048), 0.01f);
  EXPECT_TRUE(std::isinf(adcRawToOhms(0, 10000)));
  EXPECT_FLOAT_EQ(0.0f, adcRawToOhms(4095, 10000));
  EXPECT_NEAR(10000.0f, adcRawToOhms(2048, 10000), 10.0f);
}

TEST_F(DeviceTest, ReadAdcChannelByIndex) {
  ASSERT_TRUE(rig.begin());
  rig.board.adcRaw[4] = 1234;
  uint16_t raw = 0;
  EXPECT_TRUE(rig.device.readAdcChannel(2, &raw));
  EXPECT_EQ(1234, raw);
  EXPECT_FALSE(rig.device.readAdcChannel(4, &raw));
}

TEST_F(DeviceTest, PwmResolutionFollowsFrequency) {
  ASSERT_TRUE(rig.begin());
  PwmOutput &pwm = rig.device.pwms().at(0);
  ProbeError err;
  EXPECT_EQ(14, rig.device.pwmSlice(0).resolutionBits);

  ASSERT_TRUE(rig.device.configurePwm(pwm, 10000, 0, err));
  EXPECT_EQ(12, rig.device.pwmSlice(0).resolutionBits);
  EXPECT_EQ(4096u, rig.device.pwmFullScale(pwm));

  ASSERT_TRUE(rig.device.configurePwm(pwm, 1000000, 0, err));
  EXPECT_EQ(6, rig.device.pwmSlice(0).resolutionBits);
  EXPECT_EQ(1000000u, rig.board.sliceFreq[0]);
}

TEST_F(DeviceTest, PwmTopLimitsResolution) {
  ASSERT_TRUE(rig.begin());
  PwmOutput &pwm = rig.device.pwms().at(2);
  ProbeError err;
  ASSERT_TRUE(rig.device.configurePwm(pwm, 50, 255, err));
  EXPECT_EQ(8, rig.device.pwmSlice(1).resolutionBits);
  ASSERT_TRUE(rig.device.configurePwm(pwm, 50, 1000, err));
  EXPECT_EQ(10, rig.device.pwmSlice(1).resolutionBits);
}

TEST_F(DeviceTest, PwmRejectsBadFrequency) {
  ASSERT_TRUE(rig.begin());
  PwmOutput &pwm = rig.device.pwms().at(0);
  ProbeError err;
  EXPECT_FALSE(rig.device.configurePwm(pwm, 0, 0, err));
  EXPECT_EQ(ErrorCode::CmdExec, err.code);
  EXPECT_FALSE(rig.device.configurePwm(pwm, kPwmSourceClockHz, 0, err));
}

TEST_F(DeviceTest, UnchangedSliceIsNotReconfigured) {
  ASSERT_TRUE(rig.begin());
  const uint32_t before = rig.board.sliceConfigs;
  ProbeError err;
  ASSERT_TRUE(rig.device.configurePwm(rig.device.pwms().at(1), 50, 0, err));
  EXPECT_EQ(before, rig.board.sliceConfigs);
}

TEST_F(DeviceTest, DutyPercentAndCentredPhase) {
  ASSERT_TRUE(rig.begin());
  PwmOutput &pwm = rig.device.pwms().at(0);
  rig.device.setPwmDutyPercent(pwm, 50, false);
  EXPECT_EQ(8192u, rig.board.duty[0]);
  EXPECT_EQ(0u, rig.board.hpoint[0]);
  EXPECT_TRUE(pwm.enabled);

  rig.device.setPwmDutyPercent(pwm, 50, true);
  EXPECT_EQ(4096u, rig.board.hpoint[0]);

  rig.device.setPwmDutyPercent(pwm, 250, false);
  EXPECT_EQ(16384u, rig.board.duty[0]);
}

TEST_F(DeviceTest, DutyMicroseconds) {
  ASSERT_TRUE(rig.begin());
  PwmOutput &pwm = rig.device.pwms().at(0);
  rig.device.setPwmDutyUs(pwm, 1500, false);
  EXPECT_EQ(1228u, rig.board.duty[0]);
  rig.device.setPwmDutyUs(pwm, 30000, false);
  EXPECT_EQ(16384u, rig.board.duty[0]);
}

TEST_F(DeviceTest, DisableStopsChannel) {
  ASSERT_TRUE(rig.begin());
  PwmOutput &pwm = rig.device.pwms().at(1);
  rig.device.setPwmDutyPercent(pwm, 10, false);
  rig.device.disablePwm(pwm);
  EXPECT_TRUE(rig.board.stopped[1]);
  EXPECT_FALSE(pwm.enabled);
}

TEST_F(DeviceTest, I2cClaimsBusPinsOnce) {
  ProbeError err;
  ASSERT_TRUE(rig.device.ensureI2c(err));
  ASSERT_TRUE(rig.device.ensureI2c(err));
  EXPECT_EQ(1u, rig.board.i2cBegins);
  EXPECT_EQ(8, rig.board.i2cSda);
  EXPECT_EQ(9, rig.board.i2cScl);
  EXPECT_EQ(kI2cScanFreqHz, rig.board.i2cFreq);
  EXPECT_TRUE(rig.pins.isClaimed(8));
  EXPECT_TRUE(rig.pins.isClaimed(9));
}

TEST_F(DeviceTest, I2cFailsWhenPinTakenElsewhere) {
  ProbeError err;
  ASSERT_TRUE(rig.pins.claim(9, PinCapability::Raw, nullptr, err));
  EXPECT_FALSE(rig.device.ensureI2c(err));
  EXPECT_EQ(ErrorCode::PinAlreadyConfigured, err.code);
  EXPECT_EQ(0u, rig.board.i2cBegins);
}

TEST_F(DeviceTest, SpiParksChipSelectHigh) {
  ProbeError err;
  ASSERT_TRUE(rig.device.ensureSpi(err));
  EXPECT_EQ(10, rig.device.spiCsPin());
  EXPECT_TRUE(rig.board.isOutput[10]);
  EXPECT_TRUE(rig.board.level[10]);
  for (uint8_t gpio = 10; gpio <= 13; ++gpio) {
    EXPECT_TRUE(rig.pins.isClaimed(gpio));
  }
  ASSERT_TRUE(rig.device.ensureSpi(err));
  EXPECT_EQ(1u, rig.board.spiBegins);
}

TEST_F(DeviceTest, WaitRunsToCompletionWithoutCancel) {
  rig.transport.clearInterrupt();
  EXPECT_TRUE(rig.device.waitMs(95));
  EXPECT_EQ(95u, rig.board.totalDelayMs);
}

TEST_F(DeviceTest, WaitStopsOnInterruptChar) {
  rig.transport.clearInterrupt();
  rig.port.scheduleRx(3, "~");
  EXPECT_FALSE(rig.device.waitMs(10000));
  EXPECT_LT(rig.board.totalDelayMs, 100u);
  EXPECT_TRUE(rig.transport.interruptTriggered());
}

TEST_F(DeviceTest, WaitStopsWhenHostLeaves) {
  rig.port.connected = false;
  EXPECT_FALSE(rig.device.waitMs(1000));
  EXPECT_EQ(0u, rig.board.totalDelayMs);
}
