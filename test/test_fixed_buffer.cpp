#include <gtest/gtest.h>

#include "FixedBuffer.h"

TEST(FixedBufferTest, AppendSaturatesAtCapacity) {
  FixedBuffer<4> buf;
  const uint8_t bytes[] = {1, 2, 3, 4, 5, 6};
  EXPECT_EQ(3u, buf.append(bytes, 3));
  EXPECT_EQ(1u, buf.append(bytes + 3, 3));
  EXPECT_TRUE(buf.isFull());
  EXPECT_EQ(0u, buf.append(bytes, 1));
  EXPECT_FALSE(buf.addSingle(9));
  EXPECT_EQ(4, buf.data()[3]);
}

TEST(FixedBufferTest, PopFrontShiftsRemainingBytesDown) {
  FixedBuffer<8> buf;
  buf.append("abcdef");
  buf.popFront(2);
  ASSERT_EQ(4u, buf.size());
  EXPECT_EQ(0, memcmp(buf.data(), "cdef", 4));
  buf.popFront(100);
  EXPECT_TRUE(buf.isEmpty());
}

TEST(FixedBufferTest, ReadConsumesFromTheFront) {
  FixedBuffer<8> buf;
  buf.append("hello");
  uint8_t out[3];
  EXPECT_EQ(3u, buf.read(out, sizeof(out)));
  EXPECT_EQ(0, memcmp(out, "hel", 3));
  uint8_t single = 0;
  EXPECT_TRUE(buf.readSingle(&single));
  EXPECT_EQ('l', single);
  EXPECT_EQ(1u, buf.size());
}

TEST(FixedBufferTest, ReceiveRegionAndAdvanceFillInPlace) {
  FixedBuffer<6> buf;
  buf.addSingle('>');
  memcpy(buf.receiveRegion(), "abc", 3);
  buf.advance(3);
  EXPECT_EQ(4u, buf.size());
  EXPECT_EQ(2u, buf.available());
  buf.advance(50);
  EXPECT_TRUE(buf.isFull());
  buf.setEnd(1);
  EXPECT_EQ(1u, buf.size());
}

TEST(FixedBufferTest, ContainsFindsFirstOccurrence) {
  FixedBuffer<16> buf;
  buf.append("abc\r\nabc\r\n");
  EXPECT_EQ(3, buf.contains('\r'));
  EXPECT_EQ(-1, buf.contains('x'));
  const uint8_t crlf[] = {'\r', '\n'};
  EXPECT_EQ(3, buf.containsSlice(crlf, 2));
  EXPECT_EQ(1, buf.containsStr("bc"));
  EXPECT_EQ(-1, buf.containsStr("abd"));
  EXPECT_EQ(-1, buf.containsStr("this is longer than the buffer"));
}

TEST(FixedBufferTest, ClearEmptiesWithoutTouchingCapacity) {
  FixedBuffer<3> buf;
  buf.append("xyz");
  buf.clear();
  EXPECT_TRUE(buf.isEmpty());
  EXPECT_EQ(3u, buf.capacity());
  EXPECT_EQ(3u, buf.available());
}
