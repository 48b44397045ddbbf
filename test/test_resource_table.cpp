#include <gtest/gtest.h>

#include <string.h>

#include "PinDefinitions.h"
#include "ResourceTable.h"

TEST(ResourceTableTest, PlaceholdersAreDropped) {
  ResourceTable pins(kPinDefinitions, kPinDefinitionCount);
  size_t real = 0;
  for (size_t i = 0; i < kPinDefinitionCount; ++i) {
    if (kPinDefinitions[i].id != kPinNotAssigned) {
      real++;
    }
  }
  EXPECT_EQ(real, pins.size());
  uint8_t id = 0;
  ProbeError err;
  EXPECT_FALSE(pins.getGpio("OUT_C", &id, err));
  EXPECT_EQ(ErrorCode::AliasNotFound, err.code);
}

TEST(ResourceTableTest, EveryPinCanBeClaimedExactlyOnce) {
  ResourceTable pins(kPinDefinitions, kPinDefinitionCount);
  for (size_t i = 0; i < pins.size(); ++i) {
    const uint8_t id = pins.at(i).id;
    ProbeError err;
    PinHandle handle;
    ASSERT_TRUE(pins.claim(id, PinCapability::Raw, &handle, err)) << pins.at(i).alias;
    EXPECT_EQ(id, handle.gpio);
    EXPECT_STREQ(pins.at(i).alias, handle.alias);
    EXPECT_TRUE(pins.isClaimed(id));

    EXPECT_FALSE(pins.claim(id, PinCapability::DigitalOut, nullptr, err));
    EXPECT_EQ(ErrorCode::PinAlreadyConfigured, err.code);
  }
}

TEST(ResourceTableTest, UnknownGpioCannotBeClaimed) {
  ResourceTable pins(kPinDefinitions, kPinDefinitionCount);
  ProbeError err;
  EXPECT_FALSE(pins.claim(33, PinCapability::Raw, nullptr, err));
  EXPECT_EQ(ErrorCode::GpioNotFound, err.code);
  EXPECT_FALSE(pins.isClaimed(33));
}

TEST(ResourceTableTest, ClaimByAliasIsCaseInsensitive) {
  ResourceTable pins(kPinDefinitions, kPinDefinitionCount);
  ProbeError err;
  PinHandle handle;
  ASSERT_TRUE(pins.claimByAlias("led", PinCapability::DigitalOut, &handle, err));
  EXPECT_EQ(2, handle.gpio);
  EXPECT_STREQ("LED", handle.alias);
  EXPECT_EQ(PinCapability::DigitalOut, handle.capability);
  EXPECT_FALSE(pins.claimByAlias("LED", PinCapability::DigitalOut, &handle, err));
  EXPECT_EQ(ErrorCode::PinAlreadyConfigured, err.code);
}

TEST(ResourceTableTest, LookupsBothWays) {
  ResourceTable pins(kPinDefinitions, kPinDefinitionCount);
  ProbeError err;
  uint8_t id = 0;
  EXPECT_TRUE(pins.getGpio("SPI0_MISO", &id, err));
  EXPECT_EQ(13, id);
  const char *alias = nullptr;
  EXPECT_TRUE(pins.getAlias(41, &alias, err));
  EXPECT_STREQ("C1_IN_A", alias);
  EXPECT_FALSE(pins.getAlias(30, &alias, err));
  EXPECT_EQ(ErrorCode::GpioNotFound, err.code);

  PinGroup group = PinGroup::Reserved;
  EXPECT_TRUE(pins.getGroup(6, &group));
  EXPECT_EQ(PinGroup::Pwm, group);
  EXPECT_FALSE(pins.getGroup(30, &group));
}

TEST(ResourceTableTest, GpioAliasPairPrefersExplicitId) {
  ResourceTable pins(kPinDefinitions, kPinDefinitionCount);
  ProbeError err;
  uint8_t id = 0;
  const char *alias = nullptr;
  ASSERT_TRUE(pins.getGpioAliasPair(true, 38, "LED", &id, &alias, err));
  EXPECT_EQ(38, id);
  EXPECT_STREQ("OUT_A", alias);

  ASSERT_TRUE(pins.getGpioAliasPair(false, 0, "in_b", &id, &alias, err));
  EXPECT_EQ(21, id);
  EXPECT_STREQ("IN_B", alias);

  EXPECT_FALSE(pins.getGpioAliasPair(false, 0, "NOPE", &id, &alias, err));
  EXPECT_EQ(ErrorCode::AliasNotFound, err.code);
  EXPECT_FALSE(pins.getGpioAliasPair(false, 0, nullptr, &id, &alias, err));
  EXPECT_EQ(ErrorCode::GpioNotFound, err.code);
}

TEST(ResourceTableTest, GroupPinsInTableOrder) {
  ResourceTable pins(kPinDefinitions, kPinDefinitionCount);
  uint8_t ids[8];
  ASSERT_EQ(4u, pins.groupPins(PinGroup::Pwm, ids, 8));
  EXPECT_EQ(6, ids[0]);
  EXPECT_EQ(7, ids[1]);
  EXPECT_EQ(15, ids[2]);
  EXPECT_EQ(16, ids[3]);
  EXPECT_EQ(2u, pins.groupPins(PinGroup::Adc, ids, 2));
  EXPECT_EQ(0u, pins.groupPins(PinGroup::C1Uart, ids, 8));
}

TEST(ResourceTableTest, GroupAndCapabilityNames) {
  EXPECT_STREQ("C1_Outputs", pinGroupName(PinGroup::C1Outputs));
  EXPECT_STREQ("Inputs", pinGroupName(PinGroup::Inputs));
  EXPECT_STREQ("output", pinCapabilityName(PinCapability::DigitalOut));
  EXPECT_STREQ("pwm", pinCapabilityName(PinCapability::Pwm));
}

TEST(ResourceTableDeathTest, DuplicateGpioHalts) {
  const PinDef defs[] = {
      {"A", 4, PinGroup::Outputs},
      {"B", 4, PinGroup::Inputs},
  };
  EXPECT_DEATH({ ResourceTable table(defs, 2); }, "duplicate config pin: 4 \\(B\\)");
}

TEST(ResourceTableDeathTest, OutOfRangeGpioHalts) {
  const PinDef defs[] = {
      {"FAR", static_cast<uint8_t>(kGpioCount), PinGroup::Other},
  };
  EXPECT_DEATH({ ResourceTable table(defs, 1); }, "pin out of bounds");
}
