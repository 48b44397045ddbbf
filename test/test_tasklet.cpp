#include <gtest/gtest.h>

#include "FakeHardware.h"

TEST(TaskletTest, FirstPollFiresAndStartsCountdown) {
  FakeCountDown countDown;
  Tasklet task(200, 3, countDown);
  EXPECT_TRUE(task.isReady());
  EXPECT_TRUE(countDown.running);
  EXPECT_EQ(200000u, countDown.lastPeriodUs);
  EXPECT_FALSE(task.isReady());
}

TEST(TaskletTest, FiresOncePerExpiredPeriodUntilExhausted) {
  FakeCountDown countDown;
  Tasklet task(10, 3, countDown);
  EXPECT_TRUE(task.isReady());
  countDown.pending = 1;
  EXPECT_TRUE(task.isReady());
  EXPECT_FALSE(task.isReady());
  EXPECT_FALSE(task.isExhausted());
  countDown.pending = 1;
  EXPECT_TRUE(task.isReady());
  EXPECT_TRUE(task.isExhausted());
  EXPECT_FALSE(countDown.running);

  countDown.pending = 5;
  EXPECT_FALSE(task.isReady());
}

TEST(TaskletTest, SingleRunCancelsImmediately) {
  FakeCountDown countDown;
  Tasklet task(10, 1, countDown);
  EXPECT_TRUE(task.isReady());
  EXPECT_TRUE(task.isExhausted());
  EXPECT_EQ(1u, countDown.cancels);
}

TEST(TaskletTest, ZeroRunsIsUnlimited) {
  FakeCountDown countDown;
  countDown.autoExpire = true;
  Tasklet task(1, 0, countDown);
  for (int i = 0; i < 1000; ++i) {
    EXPECT_TRUE(task.isReady());
  }
  EXPECT_FALSE(task.isExhausted());
}

TEST(TaskletTest, ResetStartsOver) {
  FakeCountDown countDown;
  countDown.autoExpire = true;
  Tasklet task(5, 2, countDown);
  EXPECT_TRUE(task.isReady());
  EXPECT_TRUE(task.isReady());
  EXPECT_TRUE(task.isExhausted());
  task.reset();
  EXPECT_FALSE(task.isExhausted());
  EXPECT_TRUE(task.isReady());
  EXPECT_EQ(2u, countDown.starts);
}

TEST(TaskletTest, CancelStopsTheCountdown) {
  FakeCountDown countDown;
  Tasklet task(5, 0, countDown);
  EXPECT_TRUE(task.isReady());
  task.cancel();
  EXPECT_FALSE(countDown.running);
  countDown.pending = 3;
  EXPECT_FALSE(task.isReady());
}
