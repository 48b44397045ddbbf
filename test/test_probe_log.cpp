#include <gtest/gtest.h>

#include <string>

#include "FakeHardware.h"

class ProbeLogTest : public ::testing::Test {
 protected:
  ProbeLogTest() : transport(port, lock, spin) {
    savedLevel = probeLog().level();
    probeLog().attach(&transport);
  }
  ~ProbeLogTest() override {
    probeLog().attach(nullptr);
    probeLog().setLevel(savedLevel);
  }

  FakeSerialPort port;
  CountingLock lock;
  FakeSpinDelay spin;
  ByteTransport transport;
  LogLevel savedLevel;
};

TEST_F(ProbeLogTest, LinesCarryTheirLevelTag) {
  probeLog().setLevel(LogLevel::Trace);
  PINPROBE_LOGE("bad %d", 1);
  PINPROBE_LOGI("fine");
  EXPECT_EQ("[ERROR] bad 1\r\n[INFO]  fine\r\n", port.tx);
}

TEST_F(ProbeLogTest, LevelFiltersLessSevereLines) {
  probeLog().setLevel(LogLevel::Warn);
  PINPROBE_LOGE("e");
  PINPROBE_LOGW("w");
  PINPROBE_LOGI("i");
  PINPROBE_LOGD("d");
  PINPROBE_LOGT("t");
  EXPECT_NE(std::string::npos, port.tx.find("[ERROR] e"));
  EXPECT_NE(std::string::npos, port.tx.find("[WARN]  w"));
  EXPECT_EQ(std::string::npos, port.tx.find("[INFO]"));
  EXPECT_EQ(std::string::npos, port.tx.find("[DEBUG]"));
  EXPECT_EQ(std::string::npos, port.tx.find("[TRACE]"));
}

TEST_F(ProbeLogTest, OffSilencesEverything) {
  probeLog().setLevel(LogLevel::Off);
  PINPROBE_LOGE("e");
  EXPECT_TRUE(port.tx.empty());
  EXPECT_FALSE(probeLog().enabled(LogLevel::Off));
}

TEST_F(ProbeLogTest, NothingIsWrittenWithoutAHost) {
  probeLog().setLevel(LogLevel::Trace);
  port.connected = false;
  PINPROBE_LOGE("lost");
  EXPECT_TRUE(port.tx.empty());
  EXPECT_EQ(0u, transport.droppedWrites());
}

TEST_F(ProbeLogTest, DetachedLoggerIsSilent) {
  probeLog().setLevel(LogLevel::Trace);
  probeLog().attach(nullptr);
  PINPROBE_LOGE("nowhere");
  EXPECT_TRUE(port.tx.empty());
}

TEST(LogLevelTest, ParsesNamesAndNumbers) {
  LogLevel level = LogLevel::Off;
  EXPECT_TRUE(parseLogLevel("debug", &level));
  EXPECT_EQ(LogLevel::Debug, level);
  EXPECT_TRUE(parseLogLevel("WARN", &level));
  EXPECT_EQ(LogLevel::Warn, level);
  EXPECT_TRUE(parseLogLevel("0", &level));
  EXPECT_EQ(LogLevel::Off, level);
  EXPECT_FALSE(parseLogLevel("6", &level));
  EXPECT_FALSE(parseLogLevel("loud", &level));
  EXPECT_FALSE(parseLogLevel("", &level));
  EXPECT_STREQ("trace", logLevelName(LogLevel::Trace));
}
