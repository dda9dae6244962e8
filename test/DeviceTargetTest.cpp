#include <gtest/gtest.h>

#include "src/domain/DeviceTarget.h"
#include "src/domain/HeartRateSettings.h"

TEST(DeviceTargetTest, DefaultIsAnyDevice) {
  DeviceTarget t;
  EXPECT_FALSE(t.hasAddress);
  EXPECT_EQ("any heart rate device", t.describe());
}

TEST(DeviceTargetTest, ParsesColonHex) {
  DeviceTarget t;
  ASSERT_TRUE(DeviceTarget::parse("C0:FF:EE:12:34:5a", t));
  EXPECT_TRUE(t.hasAddress);
  EXPECT_EQ(0xC0FFEE12345Aull, t.address);
  EXPECT_EQ("C0:FF:EE:12:34:5A", t.describe());
}

TEST(DeviceTargetTest, ParsesDecimal) {
  DeviceTarget t;
  ASSERT_TRUE(DeviceTarget::parse(" 211710513050202 ", t));
  EXPECT_TRUE(t.hasAddress);
  EXPECT_EQ(211710513050202ull, t.address);
}

TEST(DeviceTargetTest, BlankMeansAnyDevice) {
  DeviceTarget t = DeviceTarget::forAddress(1);
  ASSERT_TRUE(DeviceTarget::parse("   ", t));
  EXPECT_FALSE(t.hasAddress);

  t = DeviceTarget::forAddress(1);
  ASSERT_TRUE(DeviceTarget::parse(nullptr, t));
  EXPECT_FALSE(t.hasAddress);
}

TEST(DeviceTargetTest, RejectsMalformedText) {
  DeviceTarget t = DeviceTarget::forAddress(42);
  EXPECT_FALSE(DeviceTarget::parse("C0:FF:EE:12:34", t));
  EXPECT_FALSE(DeviceTarget::parse("C0-FF-EE-12-34-5A", t));
  EXPECT_FALSE(DeviceTarget::parse("G0:FF:EE:12:34:5A", t));
  EXPECT_FALSE(DeviceTarget::parse("12ab", t));
  EXPECT_FALSE(DeviceTarget::parse("281474976710656", t));  // 2^48
  EXPECT_TRUE(t.hasAddress);
  EXPECT_EQ(42u, t.address);
}

TEST(DeviceTargetTest, ForAddressMasksTo48Bits) {
  DeviceTarget t = DeviceTarget::forAddress(0xFF0000000000ABCDull | (1ull << 60));
  EXPECT_EQ(0xFF0000000000ABCDull & DeviceTarget::kAddressMask, t.address);
}

TEST(DeviceTargetTest, FormatRoundTripsThroughParse) {
  DeviceTarget t;
  ASSERT_TRUE(DeviceTarget::parse(DeviceTarget::format(0x0A0B0C0D0E0Full).c_str(), t));
  EXPECT_EQ(0x0A0B0C0D0E0Full, t.address);
}

TEST(HeartRateSettingsTest, NormalizeRestoresDefaults) {
  HeartRateSettings s;
  s.disconnectedTimeoutMs = 0;
  s.watchdogPollMs = 0;
  s.logLevel = 9;
  s.normalize();
  EXPECT_EQ((uint32_t)BUILD_DISCONNECTED_TIMEOUT_MS, s.disconnectedTimeoutMs);
  EXPECT_EQ((uint32_t)BUILD_WATCHDOG_POLL_MS, s.watchdogPollMs);
  EXPECT_EQ(2, s.logLevel);
}
