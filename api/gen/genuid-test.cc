#include <gtest/gtest.h>

#include "genuid.hpp"

// The process generator outlives each test, so the whole lifecycle runs in
// one test body in order.
TEST(GenUIDTest, Lifecycle) {
  const auto uninitialized = genuid::GenerateUID();
  ASSERT_FALSE(uninitialized.ok());
  EXPECT_TRUE(absl::IsFailedPrecondition(uninitialized.status()));

  EXPECT_TRUE(absl::IsInvalidArgument(
      genuid::InitParameters(300, horaid::Layout::kSequence)));

  ASSERT_TRUE(genuid::InitParameters(12, horaid::Layout::kSequence).ok());
  EXPECT_TRUE(absl::IsFailedPrecondition(
      genuid::InitParameters(13, horaid::Layout::kSequence)));

  const auto first = genuid::GenerateUID();
  const auto second = genuid::GenerateUID();
  ASSERT_TRUE(first.ok()) << first.status();
  ASSERT_TRUE(second.ok()) << second.status();
  EXPECT_LT(*first, *second);
  EXPECT_EQ(first->bytes()[horaid::kMachineOffset], 12);
}
