#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

#include "stdlib/lib/math.hpp"

namespace {

using Int32Limits = std::numeric_limits<int32_t>;

TEST(MathRuntimeTest, PowIntDoesNotSquarePastTheLastBit) {
  EXPECT_EQ(math_pow_int(2, 16), 65536);
  EXPECT_EQ(math_pow_int(300, 2), 90000);
  EXPECT_EQ(math_pow_int(46340, 2), 2147395600);
  EXPECT_EQ(math_pow_int(-3, 3), -27);
  EXPECT_EQ(math_pow_int(7, 0), 1);
  EXPECT_EQ(math_pow_int(0, 0), 1);
}

TEST(MathRuntimeTest, PowIntWrapsOnOverflow) {
  EXPECT_EQ(math_pow_int(2, 31), Int32Limits::min());
  EXPECT_EQ(math_pow_int(2, 32), 0);
  EXPECT_EQ(math_pow_int(-2, 31), Int32Limits::min());
}

TEST(MathRuntimeTest, PowIntNegativeExponentIsZero) {
  EXPECT_EQ(math_pow_int(2, -1), 0);
  EXPECT_EQ(math_pow_int(1, -5), 0);
}

TEST(MathRuntimeTest, AbsIntOfMinimumWraps) {
  EXPECT_EQ(math_abs_int(-5), 5);
  EXPECT_EQ(math_abs_int(Int32Limits::max()), Int32Limits::max());
  EXPECT_EQ(math_abs_int(Int32Limits::min() + 1), Int32Limits::max());
  EXPECT_EQ(math_abs_int(Int32Limits::min()), Int32Limits::min());
}

TEST(MathRuntimeTest, ToIntTruncatesAndSaturates) {
  EXPECT_EQ(math_to_int(-2.7), -2);
  EXPECT_EQ(math_to_int(2.7), 2);
  EXPECT_EQ(math_to_int(1e20), Int32Limits::max());
  EXPECT_EQ(math_to_int(-1e20), Int32Limits::min());
  EXPECT_EQ(
      math_to_int(std::numeric_limits<double>::infinity()),
      Int32Limits::max());
  EXPECT_EQ(math_to_int(2147483647.9), Int32Limits::max());
  EXPECT_EQ(math_to_int(-2147483648.5), Int32Limits::min());
  EXPECT_EQ(math_to_int(std::numeric_limits<double>::quiet_NaN()), 0);
}

}  // namespace
