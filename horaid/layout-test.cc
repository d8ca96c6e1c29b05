#include <gtest/gtest.h>

#include <limits>
#include <string>

#include "clock.hpp"
#include "errors.hpp"
#include "id.hpp"
#include "layout.hpp"

TEST(ScaleMillisTest, KnownValues) {
  EXPECT_EQ(horaid::ScaleMillis(0), 0);
  EXPECT_EQ(horaid::ScaleMillis(1), 0);
  EXPECT_EQ(horaid::ScaleMillis(5), 1);
  EXPECT_EQ(horaid::ScaleMillis(498), 127);
  EXPECT_EQ(horaid::ScaleMillis(500), 128);
  EXPECT_EQ(horaid::ScaleMillis(995), 254);
  EXPECT_EQ(horaid::ScaleMillis(997), 255);
  EXPECT_EQ(horaid::ScaleMillis(999), 255);
}

TEST(ScaleMillisTest, Unscale) {
  EXPECT_EQ(horaid::UnscaleFraction(horaid::ScaleMillis(500)), 500);
  EXPECT_EQ(horaid::UnscaleFraction(0), 0);
  EXPECT_EQ(horaid::UnscaleFraction(255), 996);
}

TEST(ScaleMillisTest, NonDecreasing) {
  for (std::uint32_t ms = 1; ms < 1000; ms++) {
    ASSERT_LE(horaid::ScaleMillis(ms - 1), horaid::ScaleMillis(ms)) << ms;
  }
}

TEST(TickTest, Ordering) {
  const horaid::Tick a{10, 255};
  const horaid::Tick b{11, 0};
  const horaid::Tick c{11, 1};

  EXPECT_LT(a, b);
  EXPECT_LT(b, c);
  EXPECT_GT(c, a);
  EXPECT_EQ(b, (horaid::Tick{11, 0}));
  EXPECT_EQ(b.Packed(), 11U << 8);
}

TEST(PackTest, SequenceLayout) {
  const horaid::Fields fields{{0x00cd01da, 0xff}, 0x01, 0x0001};
  const horaid::Id id = horaid::Pack(horaid::Layout::kSequence, fields);

  ASSERT_EQ(id.bytes(), (horaid::Id::Bytes{0x00, 0xcd, 0x01, 0xda, 0xff, 0x01,
                                           0x00, 0x01}));
  ASSERT_EQ(horaid::Unpack(horaid::Layout::kSequence, id), fields);
}

TEST(PackTest, RandomLayoutDropsMachineId) {
  const horaid::Fields fields{{0x01020304, 0x05}, 0x77, 0xabcdef};
  const horaid::Id id = horaid::Pack(horaid::Layout::kRandom, fields);

  ASSERT_EQ(id.bytes(), (horaid::Id::Bytes{0x01, 0x02, 0x03, 0x04, 0x05, 0xab,
                                           0xcd, 0xef}));

  const horaid::Fields unpacked = horaid::Unpack(horaid::Layout::kRandom, id);
  EXPECT_EQ(unpacked.tick, fields.tick);
  EXPECT_EQ(unpacked.machine_id, 0);
  EXPECT_EQ(unpacked.tail, 0xabcdefU);
}

TEST(PackTest, TailIsMaskedToFieldWidth) {
  const horaid::Id seq = horaid::Pack(horaid::Layout::kSequence,
                                      horaid::Fields{{1, 2}, 3, 0x12345});
  EXPECT_EQ(seq.ToString(), "0000000102032345");

  const horaid::Id rnd = horaid::Pack(horaid::Layout::kRandom,
                                      horaid::Fields{{1, 2}, 3, 0x7654321});
  EXPECT_EQ(rnd.ToString(), "0000000102654321");
}

TEST(PackTest, TimestampDominatesOrdering) {
  const horaid::Id early = horaid::Pack(
      horaid::Layout::kSequence, horaid::Fields{{100, 254}, 0xff, 0xffff});
  const horaid::Id late = horaid::Pack(horaid::Layout::kSequence,
                                       horaid::Fields{{100, 255}, 0, 0});
  EXPECT_LT(early, late);
  EXPECT_LT(early.ToU64(), late.ToU64());
  EXPECT_LT(early.ToString(), late.ToString());
}

TEST(TickFromUnixMillisTest, Epoch) {
  auto tick = horaid::TickFromUnixMillis(horaid::kEpochMillis);
  ASSERT_TRUE(tick.ok()) << tick.status();
  EXPECT_EQ(*tick, (horaid::Tick{0, 0}));

  tick = horaid::TickFromUnixMillis(horaid::kEpochMillis + 1999);
  ASSERT_TRUE(tick.ok()) << tick.status();
  EXPECT_EQ(*tick, (horaid::Tick{1, 255}));

  tick = horaid::TickFromUnixMillis(horaid::kEpochMillis + 3500);
  ASSERT_TRUE(tick.ok()) << tick.status();
  EXPECT_EQ(*tick, (horaid::Tick{3, 128}));
}

TEST(TickFromUnixMillisTest, BeforeEpoch) {
  const auto tick = horaid::TickFromUnixMillis(horaid::kEpochMillis - 1);
  ASSERT_FALSE(tick.ok());
  EXPECT_TRUE(horaid::IsTimestampRangeError(tick.status())) << tick.status();
}

TEST(TickFromUnixMillisTest, PastSecondsField) {
  const std::int64_t last =
      horaid::kEpochMillis +
      static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max()) *
          1000;

  const auto fits = horaid::TickFromUnixMillis(last + 999);
  ASSERT_TRUE(fits.ok()) << fits.status();
  EXPECT_EQ(fits->seconds, std::numeric_limits<std::uint32_t>::max());

  const auto overflow = horaid::TickFromUnixMillis(last + 1000);
  ASSERT_FALSE(overflow.ok());
  EXPECT_TRUE(horaid::IsTimestampRangeError(overflow.status()));
}

TEST(SystemClockTest, ReadsAfterEpoch) {
  const auto millis = horaid::SystemClock::Shared()->NowUnixMillis();
  ASSERT_TRUE(millis.ok()) << millis.status();
  EXPECT_GT(*millis, horaid::kEpochMillis);
  EXPECT_TRUE(horaid::TickFromUnixMillis(*millis).ok());
}

TEST(LayoutFlagTest, ParseAndUnparse) {
  horaid::Layout layout = horaid::Layout::kSequence;
  std::string error;

  ASSERT_TRUE(horaid::AbslParseFlag("random", &layout, &error));
  EXPECT_EQ(layout, horaid::Layout::kRandom);
  EXPECT_EQ(horaid::AbslUnparseFlag(layout), "random");

  ASSERT_TRUE(horaid::AbslParseFlag("sequence", &layout, &error));
  EXPECT_EQ(layout, horaid::Layout::kSequence);
  EXPECT_EQ(horaid::AbslUnparseFlag(layout), "sequence");

  EXPECT_FALSE(horaid::AbslParseFlag("tuid", &layout, &error));
  EXPECT_FALSE(error.empty());
  EXPECT_EQ(layout, horaid::Layout::kSequence);
}

TEST(CapacityTest, PerLayout) {
  EXPECT_EQ(horaid::Capacity(horaid::Layout::kSequence), 65536U);
  EXPECT_EQ(horaid::Capacity(horaid::Layout::kRandom), 16777216U);
}

TEST(BigEndianTest, SubFieldsAndWholeId) {
  horaid::IdBytes bytes{};
  horaid::StoreBigEndian(bytes, horaid::kSecondsOffset, horaid::kSecondsWidth,
                         0x00cd01da);
  horaid::StoreBigEndian(bytes, horaid::kSequenceOffset,
                         horaid::kSequenceWidth, 0x12345);

  EXPECT_EQ(bytes, (horaid::IdBytes{0x00, 0xcd, 0x01, 0xda, 0x00, 0x00, 0x23,
                                    0x45}));
  EXPECT_EQ(horaid::LoadBigEndian(bytes, horaid::kSecondsOffset,
                                  horaid::kSecondsWidth),
            0x00cd01daU);
  EXPECT_EQ(horaid::LoadBigEndian(bytes, horaid::kSequenceOffset,
                                  horaid::kSequenceWidth),
            0x2345U);
  EXPECT_EQ(horaid::LoadBigEndian(bytes, 0, horaid::kIdSize),
            0x00cd01da00002345ULL);

  const horaid::Id id = horaid::Id::FromU64(0x00cd01da00002345ULL);
  EXPECT_EQ(id.bytes(), bytes);
  EXPECT_EQ(id.Seconds(), 0x00cd01daU);
}
