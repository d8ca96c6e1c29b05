#include <gtest/gtest.h>

#include <algorithm>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

#include <absl/container/flat_hash_set.h>
#include <absl/time/time.h>

#include "id.hpp"

TEST(IdTest, DefaultIsZero) {
  const horaid::Id id;
  EXPECT_EQ(id.ToU64(), 0U);
  EXPECT_EQ(id.ToString(), "0000000000000000");
}

TEST(IdTest, ConcreteLayout) {
  const horaid::Id id{{0x00, 0xcd, 0x01, 0xda, 0xff, 0x01, 0x00, 0x01}};

  EXPECT_EQ(id.ToString(), "00cd01daff010001");
  EXPECT_EQ(id.ToU64(), 0x00cd01daff010001ULL);
  EXPECT_EQ(id.ToU64(), 57704410318438401ULL);
  EXPECT_EQ(id.Seconds(), 0x00cd01daU);
  EXPECT_EQ(id.Fraction(), 0xff);
}

TEST(IdTest, U64) {
  const std::uint64_t num = 57630818184577258ULL;
  const horaid::Id id = horaid::Id::FromU64(num);
  EXPECT_EQ(id.ToU64(), num);
  EXPECT_EQ(id.ToString(), "00ccbeec7e01c0ea");
}

TEST(IdTest, ToStringIsFixedWidthLowercase) {
  for (const std::uint64_t value :
       {0ULL, 1ULL, 0xabcULL, 0xdeadbeefULL, 0xffffffffffffffffULL}) {
    const std::string s = horaid::Id::FromU64(value).ToString();
    ASSERT_EQ(s.size(), 16U) << s;
    ASSERT_TRUE(std::all_of(s.cbegin(), s.cend(), [](char c) {
      return (c >= '0' and c <= '9') or (c >= 'a' and c <= 'f');
    })) << s;
    ASSERT_EQ(std::stoull(s, nullptr, 16), value);
  }
  EXPECT_EQ(horaid::Id::FromU64(1).ToString(), "0000000000000001");
}

TEST(IdTest, FromString) {
  const auto id = horaid::Id::FromString("00cd01daff010002");
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(id->ToU64(), 0x00cd01daff010002ULL);

  const auto upper = horaid::Id::FromString("00CD01DAFF010002");
  ASSERT_TRUE(upper.has_value());
  EXPECT_EQ(*upper, *id);
  EXPECT_EQ(upper->ToString(), "00cd01daff010002");
}

TEST(IdTest, FromStringRejects) {
  EXPECT_FALSE(horaid::Id::FromString("").has_value());
  EXPECT_FALSE(horaid::Id::FromString("00cd01daff01000").has_value());
  EXPECT_FALSE(horaid::Id::FromString("00cd01daff0100020").has_value());
  EXPECT_FALSE(horaid::Id::FromString("00cd01daff01000g").has_value());
  EXPECT_FALSE(horaid::Id::FromString("+0cd01daff010002").has_value());
  EXPECT_FALSE(horaid::Id::FromString(" 0cd01daff010002").has_value());
  EXPECT_FALSE(horaid::Id::FromString("0x00cd01daff0100").has_value());
}

TEST(IdTest, OrderingAgreesAcrossForms) {
  std::vector<std::uint64_t> values{0x00cd01daff010002ULL,
                                    0x00cd01daff010001ULL,
                                    0x00cd01db00000000ULL,
                                    0x0000000000000001ULL,
                                    0xff00000000000000ULL,
                                    0x00cd01daff020000ULL};

  for (const std::uint64_t a : values) {
    for (const std::uint64_t b : values) {
      const horaid::Id ia = horaid::Id::FromU64(a);
      const horaid::Id ib = horaid::Id::FromU64(b);
      ASSERT_EQ(ia < ib, a < b);
      ASSERT_EQ(ia == ib, a == b);
      ASSERT_EQ(ia.ToString() < ib.ToString(), a < b);
      ASSERT_EQ(ia.ToString() == ib.ToString(), a == b);
    }
  }
}

TEST(IdTest, ToTime) {
  const horaid::Id id{{0x00, 0xcd, 0x01, 0xda, 0x80, 0x01, 0x00, 0x01}};
  const absl::Time expected =
      absl::FromUnixMillis(horaid::kEpochMillis + 0x00cd01daLL * 1000 + 500);
  EXPECT_EQ(id.ToTime(), expected);
  EXPECT_EQ(absl::FormatTime("%Y-%m-%d %H:%M:%S", id.ToTime(),
                             absl::UTCTimeZone()),
            "2025-06-05 12:02:34");
}

TEST(IdTest, Hashing) {
  absl::flat_hash_set<horaid::Id> absl_set;
  std::unordered_set<horaid::Id> std_set;
  for (std::uint64_t v = 0; v < 100; v++) {
    absl_set.insert(horaid::Id::FromU64(v));
    absl_set.insert(horaid::Id::FromU64(v));
    std_set.insert(horaid::Id::FromU64(v));
  }
  EXPECT_EQ(absl_set.size(), 100U);
  EXPECT_EQ(std_set.size(), 100U);
  EXPECT_TRUE(absl_set.contains(horaid::Id::FromU64(42)));
}

TEST(IdTest, Stream) {
  std::ostringstream oss;
  oss << horaid::Id::FromU64(0xabcdef);
  EXPECT_EQ(oss.str(), "0000000000abcdef");
}
